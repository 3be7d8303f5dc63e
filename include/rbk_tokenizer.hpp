// rbk_tokenizer.hpp - Runbook (rbk) - Markdown Tokenizer
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_TOKENIZER_HPP
#define RBK_TOKENIZER_HPP

#include "rbk_core.hpp"

#include <md4c.h>
#include <cstdint>
#include <cstdlib>

namespace rbk
{
//========================================================================
// Structural events
//========================================================================

    enum class md_event_kind
    {
        heading_start,
        heading_end,
        code_start,
        code_end,
        text,
        inline_code,
        soft_break,
        hard_break,
        paragraph_start,
        paragraph_end,
        list_start,
        list_end,
        item_start,
        item_end,
        emphasis_start,
        emphasis_end,
        strong_start,
        strong_end,
        other
    };

    struct md_event
    {
        md_event_kind kind   = md_event_kind::other;
        std::string   text;             // text payload, or the language tag of code_start
        unsigned      level  = 0;       // heading level
        bool          fenced = false;   // code_start: fenced rather than indented
    };

    inline md_event make_event(md_event_kind kind, std::string text = {}, unsigned level = 0)
    {
        md_event ev;
        ev.kind  = kind;
        ev.text  = std::move(text);
        ev.level = level;
        ev.fenced = kind == md_event_kind::code_start;
        return ev;
    }

    struct token_stream
    {
        std::vector<md_event> events;
    };

    enum class tokenize_error_kind
    {
        tokenizer_failure,
    // warnings
        unterminated_fence,
    };

    using tokenize_context = context<token_stream, error<tokenize_error_kind>>;

//========================================================================
// TOKENIZER API
//========================================================================

    // Never fails. An unterminated fence is reported without its closing
    // code_end event.
    tokenize_context tokenize(std::string_view source);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline std::string attribute_text(MD_ATTRIBUTE const & attr)
        {
            if (attr.text == nullptr || attr.size == 0)
                return {};
            return std::string(attr.text, attr.size);
        }

        inline void append_utf8(std::string & out, uint32_t cp)
        {
            if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                cp = 0xFFFD;

            if (cp < 0x80)
            {
                out += static_cast<char>(cp);
            }
            else if (cp < 0x800)
            {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else if (cp < 0x10000)
            {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else
            {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        // md4c hands entities over verbatim ("&amp;", "&#x41;").
        inline std::string decode_entity(std::string_view raw)
        {
            if (raw.size() < 3 || raw.front() != '&' || raw.back() != ';')
                return std::string(raw);

            auto body = raw.substr(1, raw.size() - 2);

            if (body.starts_with('#'))
            {
                bool hex = body.size() > 1 && (body[1] == 'x' || body[1] == 'X');
                std::string digits(body.substr(hex ? 2 : 1));
                if (digits.empty())
                    return std::string(raw);

                char* end = nullptr;
                unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
                if (end != digits.c_str() + digits.size())
                    return std::string(raw);

                std::string out;
                append_utf8(out, cp > 0x10FFFF ? 0xFFFD : static_cast<uint32_t>(cp));
                return out;
            }

            if (body == "amp")  return "&";
            if (body == "lt")   return "<";
            if (body == "gt")   return ">";
            if (body == "quot") return "\"";
            if (body == "apos") return "'";
            if (body == "nbsp") return "\xC2\xA0";

            return std::string(raw);
        }

        // How a fenced block handed over by md4c actually ended.
        enum class fence_end
        {
            closed,             // by a closing fence line
            container_closed,   // by the end of its list item or block quote
            end_of_input,       // never closed
        };

        // Offset of the line after the one holding `pos`, or npos.
        inline size_t next_line_at(std::string_view source, size_t pos)
        {
            size_t nl = source.find('\n', pos);
            return nl == std::string_view::npos ? npos() : nl + 1;
        }

        inline std::string_view line_at(std::string_view source, size_t start)
        {
            auto line = source.substr(start, source.find('\n', start) - start);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            return line;
        }

        inline size_t line_number_of(std::string_view source, size_t pos)
        {
            return 1 + static_cast<size_t>(std::count(source.begin(), source.begin() + pos, '\n'));
        }

        // Block quote markers and indentation in front of a continuation line.
        inline std::string_view strip_container(std::string_view line)
        {
            size_t i = line.find_first_not_of(" \t>");
            return i == std::string_view::npos ? std::string_view{} : line.substr(i);
        }

        inline bool is_closing_fence(std::string_view line, char fence_char)
        {
            auto body = strip_container(line);
            size_t run = body.find_first_not_of(fence_char);
            if (run == std::string_view::npos)
                run = body.size();
            return run >= 3 && is_blank(body.substr(run));
        }

        // Start of the first line at or after `from` that carries a fence
        // run, or npos. Opening lines may sit behind a list marker.
        inline size_t find_fence_opener(std::string_view source, size_t from, char fence_char)
        {
            std::string run(3, fence_char);
            for (size_t at = from; at != npos() && at < source.size(); at = next_line_at(source, at))
            {
                if (line_at(source, at).find(run) != std::string_view::npos)
                    return at;
            }
            return npos();
        }

        // Looks at the lines after the block's last source line. Blank
        // lines are skipped since md4c does not hand them over.
        inline fence_end classify_fence_end(std::string_view source, size_t from, char fence_char, size_t & closer_end)
        {
            for (size_t at = from; at != npos() && at < source.size(); at = next_line_at(source, at))
            {
                auto line = line_at(source, at);
                if (is_blank(strip_container(line)))
                    continue;

                if (!is_closing_fence(line, fence_char))
                    return fence_end::container_closed;

                closer_end = at + line.size();
                return fence_end::closed;
            }
            return fence_end::end_of_input;
        }

//---------------------------------------------------------------------------

        struct tokenizer_impl
        {
            tokenize_context ctx;

            std::string_view source;

            bool        in_code_block   {false};
            bool        in_code_span    {false};
            std::string span_text;

            // furthest source offset md4c has handed over, and the same
            // within the current code block
            size_t      cursor          {0};
            size_t      code_from       {0};
            size_t      code_cursor     {0};

            void track(std::string_view chunk);
            void close_fenced_block(char fence_char);

            void run(std::string_view source);

            void push(md_event_kind kind, std::string text = {}, unsigned level = 0);
            void push_code_text(std::string_view text);

            int enter_block(MD_BLOCKTYPE type, void* detail);
            int leave_block(MD_BLOCKTYPE type, void* detail);
            int enter_span(MD_SPANTYPE type, void* detail);
            int leave_span(MD_SPANTYPE type, void* detail);
            int text(MD_TEXTTYPE type, std::string_view text);

            static int on_enter_block(MD_BLOCKTYPE type, void* detail, void* self)
            {
                return static_cast<tokenizer_impl*>(self)->enter_block(type, detail);
            }

            static int on_leave_block(MD_BLOCKTYPE type, void* detail, void* self)
            {
                return static_cast<tokenizer_impl*>(self)->leave_block(type, detail);
            }

            static int on_enter_span(MD_SPANTYPE type, void* detail, void* self)
            {
                return static_cast<tokenizer_impl*>(self)->enter_span(type, detail);
            }

            static int on_leave_span(MD_SPANTYPE type, void* detail, void* self)
            {
                return static_cast<tokenizer_impl*>(self)->leave_span(type, detail);
            }

            static int on_text(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size, void* self)
            {
                return static_cast<tokenizer_impl*>(self)->text(type, std::string_view(text, size));
            }
        };

//---------------------------------------------------------------------------

        inline void tokenizer_impl::run(std::string_view source)
        {
            MD_PARSER parser{};
            parser.abi_version = 0;
            parser.flags       = MD_DIALECT_COMMONMARK;
            parser.enter_block = &tokenizer_impl::on_enter_block;
            parser.leave_block = &tokenizer_impl::on_leave_block;
            parser.enter_span  = &tokenizer_impl::on_enter_span;
            parser.leave_span  = &tokenizer_impl::on_leave_span;
            parser.text        = &tokenizer_impl::on_text;

            this->source = source;

            int rc = md_parse(source.data(), static_cast<MD_SIZE>(source.size()), &parser, this);
            if (rc != 0)
            {
                ctx.errors.push_back({
                    tokenize_error_kind::tokenizer_failure,
                    {0},
                    "markdown tokenizer stopped early (code " + std::to_string(rc) + ")"
                });
            }
        }

//---------------------------------------------------------------------------

        // Remembers how far into the source md4c has got. Chunks md4c
        // makes up itself (newlines, indentation) live elsewhere.
        inline void tokenizer_impl::track(std::string_view chunk)
        {
            if (chunk.empty() || chunk.data() < source.data() || chunk.data() >= source.data() + source.size())
                return;

            size_t end = static_cast<size_t>(chunk.data() - source.data()) + chunk.size();
            cursor = std::max(cursor, end);
            if (in_code_block)
                code_cursor = std::max(code_cursor, end);
        }

        // md4c closes a fence silently at the end of input or of its
        // container. Only a fence left open at the end of input loses its
        // code_end; a container may legitimately end a fence.
        inline void tokenizer_impl::close_fenced_block(char fence_char)
        {
            size_t opener = find_fence_opener(source, code_from, fence_char);
            if (opener == npos())
            {
                push(md_event_kind::code_end);
                return;
            }

            size_t last = code_cursor > 0 ? std::max(opener, code_cursor - 1) : opener;
            size_t closer_end = 0;

            switch (classify_fence_end(source, next_line_at(source, last), fence_char, closer_end))
            {
                case fence_end::closed:
                    cursor = std::max(cursor, closer_end);
                    push(md_event_kind::code_end);
                    break;

                case fence_end::container_closed:
                    push(md_event_kind::code_end);
                    break;

                case fence_end::end_of_input:
                    ctx.errors.push_back({
                        tokenize_error_kind::unterminated_fence,
                        {line_number_of(source, opener)},
                        "code fence is never closed"
                    });
                    cursor = source.size();
                    break;
            }
        }

//---------------------------------------------------------------------------

        inline void tokenizer_impl::push(md_event_kind kind, std::string text, unsigned level)
        {
            md_event ev;
            ev.kind  = kind;
            ev.text  = std::move(text);
            ev.level = level;
            ctx.document.events.push_back(std::move(ev));
        }

//---------------------------------------------------------------------------

        // Code lines reach us with their newline as a separate chunk; the
        // compiler counts lines on soft breaks, so newlines become breaks.
        inline void tokenizer_impl::push_code_text(std::string_view text)
        {
            while (!text.empty())
            {
                size_t nl = text.find('\n');
                if (nl == std::string_view::npos)
                {
                    push(md_event_kind::text, std::string(text));
                    return;
                }

                if (nl > 0)
                    push(md_event_kind::text, std::string(text.substr(0, nl)));
                push(md_event_kind::soft_break);
                text.remove_prefix(nl + 1);
            }
        }

//---------------------------------------------------------------------------

        inline int tokenizer_impl::enter_block(MD_BLOCKTYPE type, void* detail)
        {
            switch (type)
            {
                case MD_BLOCK_DOC:
                    break;

                case MD_BLOCK_H:
                {
                    auto* h = static_cast<MD_BLOCK_H_DETAIL*>(detail);
                    push(md_event_kind::heading_start, {}, h->level);
                    break;
                }

                case MD_BLOCK_CODE:
                {
                    auto* cd = static_cast<MD_BLOCK_CODE_DETAIL*>(detail);
                    md_event ev;
                    ev.kind   = md_event_kind::code_start;
                    ev.text   = attribute_text(cd->lang);
                    ev.fenced = cd->fence_char != 0;
                    ctx.document.events.push_back(std::move(ev));
                    in_code_block = true;
                    code_from     = cursor == 0 ? 0 : next_line_at(source, cursor - 1);
                    code_cursor   = 0;
                    track(std::string_view(cd->info.text ? cd->info.text : "", cd->info.size));
                    break;
                }

                case MD_BLOCK_P:
                    push(md_event_kind::paragraph_start);
                    break;

                case MD_BLOCK_UL:
                case MD_BLOCK_OL:
                    push(md_event_kind::list_start);
                    break;

                case MD_BLOCK_LI:
                    push(md_event_kind::item_start);
                    break;

                default:
                    push(md_event_kind::other);
                    break;
            }
            return 0;
        }

//---------------------------------------------------------------------------

        inline int tokenizer_impl::leave_block(MD_BLOCKTYPE type, void* detail)
        {
            switch (type)
            {
                case MD_BLOCK_DOC:
                    break;

                case MD_BLOCK_H:
                    push(md_event_kind::heading_end);
                    break;

                case MD_BLOCK_CODE:
                {
                    auto* cd = static_cast<MD_BLOCK_CODE_DETAIL*>(detail);
                    if (cd->fence_char != 0)
                        close_fenced_block(cd->fence_char);
                    else
                        push(md_event_kind::code_end);
                    in_code_block = false;
                    break;
                }

                case MD_BLOCK_P:
                    push(md_event_kind::paragraph_end);
                    break;

                case MD_BLOCK_UL:
                case MD_BLOCK_OL:
                    push(md_event_kind::list_end);
                    break;

                case MD_BLOCK_LI:
                    push(md_event_kind::item_end);
                    break;

                default:
                    push(md_event_kind::other);
                    break;
            }
            return 0;
        }

//---------------------------------------------------------------------------

        inline int tokenizer_impl::enter_span(MD_SPANTYPE type, void*)
        {
            switch (type)
            {
                case MD_SPAN_EM:
                    push(md_event_kind::emphasis_start);
                    break;

                case MD_SPAN_STRONG:
                    push(md_event_kind::strong_start);
                    break;

                case MD_SPAN_CODE:
                    in_code_span = true;
                    span_text.clear();
                    break;

                default:
                    push(md_event_kind::other);
                    break;
            }
            return 0;
        }

//---------------------------------------------------------------------------

        inline int tokenizer_impl::leave_span(MD_SPANTYPE type, void*)
        {
            switch (type)
            {
                case MD_SPAN_EM:
                    push(md_event_kind::emphasis_end);
                    break;

                case MD_SPAN_STRONG:
                    push(md_event_kind::strong_end);
                    break;

                case MD_SPAN_CODE:
                    in_code_span = false;
                    push(md_event_kind::inline_code, std::move(span_text));
                    span_text.clear();
                    break;

                default:
                    push(md_event_kind::other);
                    break;
            }
            return 0;
        }

//---------------------------------------------------------------------------

        inline int tokenizer_impl::text(MD_TEXTTYPE type, std::string_view text)
        {
            track(text);

            if (in_code_span)
            {
                if (type == MD_TEXT_SOFTBR || type == MD_TEXT_BR)
                    span_text += ' ';
                else if (type == MD_TEXT_ENTITY)
                    span_text += decode_entity(text);
                else
                    span_text.append(text);
                return 0;
            }

            switch (type)
            {
                case MD_TEXT_NORMAL:
                case MD_TEXT_CODE:
                    if (in_code_block)
                        push_code_text(text);
                    else
                        push(md_event_kind::text, std::string(text));
                    break;

                case MD_TEXT_ENTITY:
                    push(md_event_kind::text, decode_entity(text));
                    break;

                case MD_TEXT_NULLCHAR:
                    push(md_event_kind::text, "\xEF\xBF\xBD");
                    break;

                case MD_TEXT_SOFTBR:
                    push(md_event_kind::soft_break);
                    break;

                case MD_TEXT_BR:
                    push(md_event_kind::hard_break);
                    break;

                default:
                    // raw HTML and math are not documentation text
                    break;
            }
            return 0;
        }

    } // namespace detail

//========================================================================
// Tokenizer API implementation
//========================================================================

    inline tokenize_context tokenize(std::string_view source)
    {
        detail::tokenizer_impl t;
        t.run(source);
        return std::move(t.ctx);
    }

} // namespace rbk

#endif // RBK_TOKENIZER_HPP
