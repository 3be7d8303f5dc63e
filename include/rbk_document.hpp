// rbk_document.hpp - Runbook (rbk) - Authoritative Document Model
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_DOCUMENT_HPP
#define RBK_DOCUMENT_HPP

#include "rbk_core.hpp"

#include <functional>
#include <span>

namespace rbk
{
//========================================================================
// Blocks
//========================================================================

    struct code_block
    {
        std::string language;       // never empty in a compiled document
        std::string content;        // trailing whitespace trimmed
        size_t      line_number = 0;

        // Interpreter command for this language. Unknown tags run under bash.
        std::string_view interpreter() const noexcept
        {
            if (language == "bash")    return "bash";
            if (language == "sh")      return "sh";
            if (language == "python" ||
                language == "python3") return "python3";
            if (language == "ruby")    return "ruby";
            if (language == "perl")    return "perl";
            if (language == "zsh")     return "zsh";
            if (language == "fish")    return "fish";
            return "bash";
        }

        bool is_shell() const noexcept
        {
            return language == "bash" || language == "sh"
                || language == "zsh"  || language == "fish";
        }

        bool operator==(code_block const &) const = default;
    };

    struct text_block
    {
        std::string content;

        bool operator==(text_block const &) const = default;
    };

    using block = std::variant<text_block, code_block>;

    inline bool is_code(block const & b)  { return std::holds_alternative<code_block>(b); }
    inline bool is_text(block const & b)  { return std::holds_alternative<text_block>(b); }

//========================================================================
// Sections
//========================================================================

    struct section
    {
        std::optional<std::string> header;
        std::optional<unsigned>    header_level;   // 1-6, metadata only
        std::vector<block>         blocks;

        static section with_header(std::string text, unsigned level)
        {
            section s;
            s.header       = std::move(text);
            s.header_level = level;
            return s;
        }

        // Sections without a header and without blocks are scaffolding
        // and never make it into a document.
        bool has_content() const noexcept
        {
            return header.has_value() || !blocks.empty();
        }

        bool operator==(section const &) const = default;
    };

//========================================================================
// Document
//========================================================================

    class document
    {
    public:
        //------------------------------------------------------------------------
        // Construction
        //------------------------------------------------------------------------

        document() = default;

        explicit document(std::vector<section> sections)
        {
            for (auto & s : sections)
                append_section(std::move(s));
        }

        //------------------------------------------------------------------------
        // Section access
        //------------------------------------------------------------------------

        size_t section_count() const noexcept
        {
            return sections_.size();
        }

        bool empty() const noexcept
        {
            return sections_.empty();
        }

        std::span<const section> sections() const noexcept
        {
            return sections_;
        }

        //------------------------------------------------------------------------
        // Steps (see rbk_steps.hpp)
        //------------------------------------------------------------------------

        std::vector<std::reference_wrapper<const code_block>> code_blocks() const;
        size_t step_count() const;

        bool operator==(document const &) const = default;

    private:

        void append_section(section s)
        {
            if (s.has_content())
                sections_.push_back(std::move(s));
        }

        std::vector<section> sections_;     // source order

        friend struct compiler;
    };

} // namespace rbk

// the step members are defined with the step index
#include "rbk_steps.hpp"

#endif // RBK_DOCUMENT_HPP
