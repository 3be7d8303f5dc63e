// rbk_core.hpp - Runbook (rbk) - Core Data Structures
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_CORE_HPP
#define RBK_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstddef>

namespace rbk
{
//========================================================================
// Source tracking
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    struct source_location
    {
        size_t line = 0;    // 1-based; 0 when unknown
    };

//========================================================================
// Diagnostics and generation context
//========================================================================

    // A diagnostic never aborts processing. Whatever produced it still
    // delivers a complete result next to it.
    template <typename Kind>
    struct error
    {
        Kind            kind;
        source_location loc;
        std::string     message;
    };

    template <typename T, typename Error>
    struct context
    {
        T document;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(WHITESPACE);
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(WHITESPACE);
            return s.substr(start, end - start + 1);
        }

        inline std::string_view trim_right(std::string_view s)
        {
            size_t end = s.find_last_not_of(WHITESPACE);
            if (end == std::string_view::npos) return {};
            return s.substr(0, end + 1);
        }

        inline bool is_blank(std::string_view s)
        {
            return s.find_first_not_of(WHITESPACE) == std::string_view::npos;
        }

        // Line count as seen by a renderer: a trailing newline does not
        // open a further, empty line.
        inline size_t count_lines(std::string_view s)
        {
            if (s.empty())
                return 0;

            size_t n = static_cast<size_t>(std::count(s.begin(), s.end(), '\n'));
            if (s.back() != '\n')
                ++n;
            return n;
        }

        inline std::vector<std::string_view> split_lines(std::string_view s)
        {
            std::vector<std::string_view> result;
            size_t pos = 0;
            while (pos < s.size())
            {
                size_t nl = s.find('\n', pos);
                if (nl == std::string_view::npos)
                {
                    result.push_back(s.substr(pos));
                    break;
                }

                auto line = s.substr(pos, nl - pos);
                if (!line.empty() && line.back() == '\r')
                    line.remove_suffix(1);
                result.push_back(line);
                pos = nl + 1;
            }
            return result;
        }

        inline std::string to_lower(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        inline std::string to_upper(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return result;
        }
    }

} // namespace rbk

#endif // RBK_CORE_HPP
