// rbk_layout.hpp - Runbook (rbk) - Rendered Line Layout
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_LAYOUT_HPP
#define RBK_LAYOUT_HPP

#include "rbk_core.hpp"
#include "rbk_document.hpp"
#include "rbk_highlight.hpp"

namespace rbk
{
//========================================================================
// Layout rules
//========================================================================
//
// A header occupies blank + header + blank. A text block occupies its
// lines plus a separator. A code block occupies a step header, its lines
// and a separator. render_lines() and the replay below must agree on
// these counts; scroll synchronisation depends on it.

    namespace layout_rules
    {
        constexpr size_t header_lines      = 3;
        constexpr size_t step_header_lines = 1;
        constexpr size_t separator_lines   = 1;
    }

    inline size_t header_layout_lines(section const & s)
    {
        return s.header ? layout_rules::header_lines : 0;
    }

    inline size_t block_layout_lines(block const & b)
    {
        if (auto const * code = std::get_if<code_block>(&b))
        {
            return layout_rules::step_header_lines
                 + detail::count_lines(code->content)
                 + layout_rules::separator_lines;
        }

        return detail::count_lines(std::get<text_block>(b).content)
             + layout_rules::separator_lines;
    }

    inline size_t layout_line_count(document const & doc)
    {
        size_t lines = 0;
        for (auto const & s : doc.sections())
        {
            lines += header_layout_lines(s);
            for (auto const & b : s.blocks)
                lines += block_layout_lines(b);
        }
        return lines;
    }

    // Replays the layout from the top until step `step` is reached and
    // returns the offset that puts it `lookback` lines below the top of
    // the viewport. Step 0 and unknown steps map to the top.
    inline size_t scroll_offset_for_step(document const & doc, size_t step, size_t lookback)
    {
        if (step == 0)
            return 0;

        size_t lines  = 0;
        size_t number = 0;

        for (auto const & s : doc.sections())
        {
            lines += header_layout_lines(s);

            for (auto const & b : s.blocks)
            {
                if (is_code(b) && ++number == step)
                    return lines > lookback ? lines - lookback : 0;

                lines += block_layout_lines(b);
            }
        }

        return 0;
    }

//========================================================================
// Rendered lines
//========================================================================

    enum class line_kind
    {
        blank,
        header,
        text,
        step_header,
        code
    };

    enum class step_status
    {
        none,
        done,
        current,
        pending
    };

    struct layout_line
    {
        line_kind   kind         = line_kind::blank;
        std::string text;
        unsigned    header_level = 0;
        size_t      step         = 0;       // step and code lines only
        std::string language;               // step and code lines only
        step_status status       = step_status::none;
        callout     note         = callout::none;
        bool        dangerous    = false;   // step header of a destructive step
    };

    inline step_status status_of(size_t step, size_t current_step)
    {
        if (step < current_step)  return step_status::done;
        if (step == current_step) return step_status::current;
        return step_status::pending;
    }

    inline std::vector<layout_line> render_lines(document const & doc, size_t current_step)
    {
        std::vector<layout_line> out;
        size_t number = 0;

        for (auto const & s : doc.sections())
        {
            if (s.header)
            {
                unsigned level = s.header_level.value_or(1);

                out.push_back({});

                layout_line h;
                h.kind         = line_kind::header;
                h.header_level = level;
                h.text         = std::string(level, '#') + " " + *s.header;
                out.push_back(std::move(h));

                out.push_back({});
            }

            for (auto const & b : s.blocks)
            {
                if (auto const * text = std::get_if<text_block>(&b))
                {
                    for (auto line : detail::split_lines(text->content))
                    {
                        layout_line l;
                        l.kind = line_kind::text;
                        l.text = std::string(line);
                        l.note = detail::is_blank(line) ? callout::none : classify_callout(line);
                        out.push_back(std::move(l));
                    }
                    out.push_back({});
                    continue;
                }

                auto const & code = std::get<code_block>(b);
                ++number;
                auto status = status_of(number, current_step);

                layout_line header;
                header.kind      = line_kind::step_header;
                header.text      = "Step " + std::to_string(number) + " [" + code.language + "]:";
                header.step      = number;
                header.language  = code.language;
                header.status    = status;
                header.dangerous = looks_dangerous(code);
                out.push_back(std::move(header));

                for (auto line : detail::split_lines(code.content))
                {
                    layout_line l;
                    l.kind     = line_kind::code;
                    l.text     = std::string(line);
                    l.step     = number;
                    l.language = code.language;
                    l.status   = status;
                    out.push_back(std::move(l));
                }
                out.push_back({});
            }
        }

        return out;
    }

} // namespace rbk

#endif // RBK_LAYOUT_HPP
