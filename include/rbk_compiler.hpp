// rbk_compiler.hpp - Runbook (rbk) - Document Compiler
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

// Standing rules:
// * Compilation never fails. Any event order yields a well-formed document.
// * Only tagged code blocks become steps. Untagged blocks stay visible as
//   fenced text.
// * Sections form a flat list. Header levels are carried, never nested.

#ifndef RBK_COMPILER_HPP
#define RBK_COMPILER_HPP

#include "rbk_core.hpp"
#include "rbk_tokenizer.hpp"
#include "rbk_document.hpp"

namespace rbk
{
    struct compile_options
    {
        std::string bullet = "\xE2\x80\xA2 ";   // "• "
    };

    enum class compile_error_kind
    {
    // all of these are notices; the document is produced regardless
        untagged_fence_folded,
        unterminated_fence_dropped,
        unterminated_heading,
        empty_heading,
        unmatched_end,
    };

    using compile_context = context<document, error<compile_error_kind>>;

    // Facade
    compile_context compile(std::span<const md_event> events, compile_options opts = {});

//========================================================================
// compiler
//========================================================================

    struct compiler
    {
        compiler(std::span<const md_event> events,
                 compile_options opts);

        compile_context run();

    private:
        enum class parse_mode
        {
            neutral,
            in_heading,
            in_code
        };

        // Immutable input
        std::span<const md_event> events_;
        compile_options           opts_;

        // Output
        compile_context out_;
        document&       doc_;

        // State
        parse_mode  mode_          {parse_mode::neutral};
        section     current_;
        std::string text_;          // prose accumulator
        std::string heading_;       // heading accumulator
        std::string code_;          // code accumulator
        std::string language_;
        unsigned    heading_level_ {1};
        size_t      line_          {1};
        size_t      code_line_     {1};

        std::string & prose();
        void flush_text();
        void close_section();
        void note(compile_error_kind kind, std::string message, size_t line);

        void handle_heading_start(md_event const & ev);
        void handle_heading_end();
        void handle_code_start(md_event const & ev);
        void handle_code_end();
        void handle_text(md_event const & ev);
        void handle_inline_code(md_event const & ev);
        void handle_soft_break();
        void handle_hard_break();
        void handle_paragraph_start();
        void handle_block_separator();
        void handle_item_start();
        void handle_item_end();
        void handle_marker(std::string_view marker);
        void finish();
    };

//========================================================================
// Implementation
//========================================================================

    inline compiler::compiler(std::span<const md_event> events,
                              compile_options opts)
        : events_(events)
        , opts_(std::move(opts))
        , out_{}
        , doc_(out_.document)
    {
    }

    inline compile_context compiler::run()
    {
        for (auto const & ev : events_)
        {
            switch (ev.kind)
            {
                case md_event_kind::heading_start:
                    handle_heading_start(ev);
                    break;

                case md_event_kind::heading_end:
                    handle_heading_end();
                    break;

                case md_event_kind::code_start:
                    handle_code_start(ev);
                    break;

                case md_event_kind::code_end:
                    handle_code_end();
                    break;

                case md_event_kind::text:
                    handle_text(ev);
                    break;

                case md_event_kind::inline_code:
                    handle_inline_code(ev);
                    break;

                case md_event_kind::soft_break:
                    handle_soft_break();
                    break;

                case md_event_kind::hard_break:
                    handle_hard_break();
                    break;

                case md_event_kind::paragraph_start:
                    handle_paragraph_start();
                    break;

                case md_event_kind::paragraph_end:
                case md_event_kind::list_start:
                case md_event_kind::list_end:
                    handle_block_separator();
                    break;

                case md_event_kind::item_start:
                    handle_item_start();
                    break;

                case md_event_kind::item_end:
                    handle_item_end();
                    break;

                case md_event_kind::emphasis_start:
                case md_event_kind::emphasis_end:
                    handle_marker("*");
                    break;

                case md_event_kind::strong_start:
                case md_event_kind::strong_end:
                    handle_marker("**");
                    break;

                default:
                    break;
            }
        }

        finish();
        return std::move(out_);
    }

//---------------------------------------------------------------------------

    // Inline content lands in the heading while one is open.
    inline std::string & compiler::prose()
    {
        return mode_ == parse_mode::in_heading ? heading_ : text_;
    }

    inline void compiler::flush_text()
    {
        if (!detail::is_blank(text_))
            current_.blocks.push_back(text_block{ text_ });
        text_.clear();
    }

    inline void compiler::close_section()
    {
        doc_.append_section(std::move(current_));
        current_ = section{};
    }

    inline void compiler::note(compile_error_kind kind, std::string message, size_t line)
    {
        out_.errors.push_back({ kind, {line}, std::move(message) });
    }

//---------------------------------------------------------------------------

    inline void compiler::handle_heading_start(md_event const & ev)
    {
        if (mode_ == parse_mode::in_code)
            return;

        flush_text();
        heading_.clear();
        heading_level_ = ev.level;
        mode_ = parse_mode::in_heading;
    }

    inline void compiler::handle_heading_end()
    {
        if (mode_ != parse_mode::in_heading)
        {
            if (mode_ == parse_mode::neutral)
                note(compile_error_kind::unmatched_end, "heading end without a start", line_);
            return;
        }

        mode_ = parse_mode::neutral;
        close_section();

        std::string header(detail::trim_sv(heading_));
        if (header.empty())
            note(compile_error_kind::empty_heading, "heading has no text", line_);

        current_ = section::with_header(std::move(header), heading_level_);
        heading_.clear();
        text_.clear();
    }

//---------------------------------------------------------------------------

    inline void compiler::handle_code_start(md_event const & ev)
    {
        if (mode_ == parse_mode::in_code)
            return;

        if (mode_ == parse_mode::in_heading)
            handle_heading_end();

        flush_text();
        mode_      = parse_mode::in_code;
        language_  = ev.text;
        code_line_ = line_;
        code_.clear();
    }

    inline void compiler::handle_code_end()
    {
        if (mode_ != parse_mode::in_code)
        {
            note(compile_error_kind::unmatched_end, "code block end without a start", line_);
            return;
        }

        mode_ = parse_mode::neutral;

        if (!language_.empty())
        {
            current_.blocks.push_back(code_block{
                language_,
                std::string(detail::trim_right(code_)),
                code_line_
            });
        }
        else if (!detail::is_blank(code_))
        {
            text_ += "```\n";
            text_ += code_;
            text_ += "```\n";
            note(compile_error_kind::untagged_fence_folded,
                 "code block without a language kept as text", code_line_);
        }

        code_.clear();
        language_.clear();
    }

//---------------------------------------------------------------------------

    inline void compiler::handle_text(md_event const & ev)
    {
        if (mode_ == parse_mode::in_code)
            code_ += ev.text;
        else
            prose() += ev.text;
    }

    inline void compiler::handle_inline_code(md_event const & ev)
    {
        if (mode_ == parse_mode::in_code)
            return;

        auto & buf = prose();
        buf += '`';
        buf += ev.text;
        buf += '`';
    }

    inline void compiler::handle_soft_break()
    {
        switch (mode_)
        {
            case parse_mode::in_code:
                code_ += '\n';
                ++line_;
                break;

            case parse_mode::neutral:
                text_ += ' ';
                break;

            case parse_mode::in_heading:
                break;
        }
    }

    inline void compiler::handle_hard_break()
    {
        if (mode_ == parse_mode::in_code)
            code_ += '\n';
        else
            prose() += '\n';
        ++line_;
    }

//---------------------------------------------------------------------------

    inline void compiler::handle_paragraph_start()
    {
        if (mode_ == parse_mode::in_code)
            return;

        auto & buf = prose();
        if (!buf.empty() && buf.back() != '\n')
            buf += '\n';
    }

    inline void compiler::handle_block_separator()
    {
        if (mode_ == parse_mode::in_code)
            return;

        prose() += '\n';
    }

    inline void compiler::handle_item_start()
    {
        if (mode_ == parse_mode::in_code)
            return;

        prose() += opts_.bullet;
    }

    inline void compiler::handle_item_end()
    {
        if (mode_ == parse_mode::in_code)
            return;

        prose() += '\n';
    }

    inline void compiler::handle_marker(std::string_view marker)
    {
        if (mode_ == parse_mode::in_code)
            return;

        prose() += marker;
    }

//---------------------------------------------------------------------------

    inline void compiler::finish()
    {
        switch (mode_)
        {
            case parse_mode::in_code:
                // the block never closed; its partial content is dropped
                note(compile_error_kind::unterminated_fence_dropped,
                     "code block never closed; content dropped", code_line_);
                code_.clear();
                language_.clear();
                break;

            case parse_mode::in_heading:
                note(compile_error_kind::unterminated_heading,
                     "heading never closed", line_);
                handle_heading_end();
                break;

            case parse_mode::neutral:
                break;
        }

        mode_ = parse_mode::neutral;
        flush_text();
        close_section();
    }

//---------------------------------------------------------------------------

    inline compile_context compile(std::span<const md_event> events, compile_options opts)
    {
        compiler c(events, std::move(opts));
        return c.run();
    }

} // namespace rbk

#endif // RBK_COMPILER_HPP
