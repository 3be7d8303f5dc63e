// rbk_highlight.hpp - Runbook (rbk) - Callouts and Code Highlighting
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_HIGHLIGHT_HPP
#define RBK_HIGHLIGHT_HPP

#include "rbk_core.hpp"
#include "rbk_document.hpp"

#include <iterator>

namespace rbk
{
//========================================================================
// Prose callouts
//========================================================================

    enum class callout
    {
        none,
        warning,
        danger,
        info
    };

    inline callout classify_callout(std::string_view line)
    {
        auto upper = detail::to_upper(line);

        if (upper.find("WARNING") != std::string::npos)
            return callout::warning;
        if (upper.find("DANGER") != std::string::npos ||
            upper.find("CRITICAL") != std::string::npos)
            return callout::danger;
        if (upper.find("INFO") != std::string::npos ||
            upper.find("NOTE") != std::string::npos)
            return callout::info;
        return callout::none;
    }

//========================================================================
// Destructive commands
//========================================================================

    inline bool looks_dangerous(std::string_view content)
    {
        static constexpr std::string_view patterns[] =
        {
            "rm -rf", "drop table", "drop database", "delete ", "--force"
        };

        auto lower = detail::to_lower(content);
        return std::any_of(std::begin(patterns), std::end(patterns),
            [&](std::string_view p) { return lower.find(p) != std::string::npos; });
    }

    inline bool looks_dangerous(code_block const & code)
    {
        return looks_dangerous(code.content);
    }

//========================================================================
// Code line spans
//========================================================================

    enum class span_style
    {
        plain,
        comment,
        variable,
        danger
    };

    struct styled_span
    {
        std::string text;
        span_style  style;

        bool operator==(styled_span const &) const = default;
    };

    namespace detail
    {
        inline bool is_var_char(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        inline bool line_looks_dangerous(std::string_view trimmed)
        {
            static constexpr std::string_view patterns[] =
            {
                "rm ", "rm -rf", "delete ", "drop ", "--force"
            };

            auto lower = to_lower(trimmed);
            return std::any_of(std::begin(patterns), std::end(patterns),
                [&](std::string_view p) { return lower.find(p) != std::string::npos; });
        }
    }

    // Shell lines get comment, variable and danger spans; other languages
    // come back as a single plain span.
    inline std::vector<styled_span> highlight_code_line(std::string_view line, std::string_view language)
    {
        std::vector<styled_span> spans;

        if (language != "bash" && language != "sh")
        {
            spans.push_back({ std::string(line), span_style::plain });
            return spans;
        }

        size_t first = line.find_first_not_of(" \t");
        if (first == std::string_view::npos)
        {
            if (!line.empty())
                spans.push_back({ std::string(line), span_style::plain });
            return spans;
        }

        if (first > 0)
            spans.push_back({ std::string(line.substr(0, first)), span_style::plain });

        auto trimmed = line.substr(first);

        if (trimmed.starts_with('#'))
        {
            spans.push_back({ std::string(trimmed), span_style::comment });
            return spans;
        }

        if (detail::line_looks_dangerous(trimmed))
        {
            spans.push_back({ std::string(trimmed), span_style::danger });
            return spans;
        }

        auto rest = trimmed;
        while (!rest.empty())
        {
            size_t dollar = rest.find('$');
            if (dollar == std::string_view::npos)
            {
                spans.push_back({ std::string(rest), span_style::plain });
                break;
            }

            if (dollar > 0)
                spans.push_back({ std::string(rest.substr(0, dollar)), span_style::plain });

            size_t end = dollar + 1;
            while (end < rest.size() && detail::is_var_char(rest[end]))
                ++end;

            spans.push_back({ std::string(rest.substr(dollar, end - dollar)), span_style::variable });
            rest.remove_prefix(end);
        }

        return spans;
    }

} // namespace rbk

#endif // RBK_HIGHLIGHT_HPP
