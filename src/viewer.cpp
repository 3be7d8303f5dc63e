// viewer.cpp - Runbook (rbk) - Full-screen Viewer
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#include "viewer.hpp"
#include "terminal.hpp"
#include "rbk_highlight.hpp"
#include "rbk_layout.hpp"
#include "rbk_log.hpp"
#include "rbk_serializer.hpp"
#include "rbk_steps.hpp"

// std::move cannot coexist with curses' move() macro
#define NCURSES_NOMACROS
#include <curses.h>
#include <unistd.h>

#include <clocale>
#include <iostream>
#include <stdexcept>

namespace rbk
{
    namespace
    {
        namespace icon
        {
            constexpr const char * done    = "\xE2\x9C\x94 ";          // ✔
            constexpr const char * current = "\xE2\x9E\xA1 ";          // ➡
            constexpr const char * pending = "\xE2\x97\x8B ";          // ○
            constexpr const char * warning = "\xE2\x9A\xA0 ";          // ⚠
            constexpr const char * danger  = "\xF0\x9F\x94\xA5 ";      // 🔥
            constexpr const char * info    = "\xE2\x84\xB9 ";          // ℹ
            constexpr const char * bar     = "\xE2\x94\x82 ";          // │
            constexpr const char * heavy   = "\xE2\x94\x83 ";          // ┃
        }

        enum colour_pair : short
        {
            pair_header1 = 1,
            pair_header2,
            pair_header,
            pair_yellow,
            pair_green,
            pair_red,
            pair_blue,
            pair_cyan,
            pair_status,
            pair_notice,
        };

        // Display columns of a UTF-8 string, one per code point.
        size_t columns(std::string_view s)
        {
            size_t n = 0;
            for (unsigned char c : s)
            {
                if ((c & 0xC0) != 0x80)
                    ++n;
            }
            return n;
        }

        // Longest prefix that fits in `width` columns, cut on a code point.
        std::string_view fit(std::string_view s, size_t width)
        {
            size_t cols = 0;
            for (size_t i = 0; i < s.size(); ++i)
            {
                if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80)
                    continue;
                if (cols == width)
                    return s.substr(0, i);
                ++cols;
            }
            return s;
        }

//---------------------------------------------------------------------------

        // Owns the curses screen. endwin() runs on every exit path.
        class curses_session
        {
        public:
            curses_session(bool colour, std::chrono::milliseconds poll)
            {
                std::setlocale(LC_ALL, "");

                if (initscr() == nullptr)
                    throw std::runtime_error("could not initialise the terminal screen");

                raw();
                noecho();
                keypad(stdscr, TRUE);
                curs_set(0);
                timeout(static_cast<int>(poll.count()));

                colour_ = colour && has_colors();
                if (colour_)
                {
                    start_color();
                    use_default_colors();
                    init_pair(pair_header1, COLOR_CYAN, -1);
                    init_pair(pair_header2, COLOR_MAGENTA, -1);
                    init_pair(pair_header, COLOR_WHITE, -1);
                    init_pair(pair_yellow, COLOR_YELLOW, -1);
                    init_pair(pair_green, COLOR_GREEN, -1);
                    init_pair(pair_red, COLOR_RED, -1);
                    init_pair(pair_blue, COLOR_BLUE, -1);
                    init_pair(pair_cyan, COLOR_CYAN, -1);
                    init_pair(pair_status, COLOR_WHITE, COLOR_BLUE);
                    init_pair(pair_notice, COLOR_WHITE, COLOR_BLACK);
                }
            }

            ~curses_session() { endwin(); }

            curses_session(curses_session const &) = delete;
            curses_session & operator=(curses_session const &) = delete;

            attr_t colour(short p) const { return colour_ ? COLOR_PAIR(p) : A_NORMAL; }

        private:
            bool colour_ {false};
        };

        // Hands the terminal back to the shell for the guard's lifetime.
        class curses_suspend
        {
        public:
            curses_suspend()
            {
                def_prog_mode();
                endwin();
            }

            ~curses_suspend()
            {
                reset_prog_mode();
                clear();
                refresh();
            }

            curses_suspend(curses_suspend const &) = delete;
            curses_suspend & operator=(curses_suspend const &) = delete;
        };

//---------------------------------------------------------------------------

        class viewer
        {
        public:
            viewer(document const & doc, viewer_options opts)
                : doc_(doc)
                , opts_(std::move(opts))
                , nav_(doc, opts_.navigation)
                , screen_(opts_.colour, opts_.poll)
            {
            }

            void run()
            {
                for (;;)
                {
                    draw();

                    int ch = getch();
                    if (ch == ERR)
                    {
                        nav_.expire_notice();
                        continue;
                    }

                    if (!handle(ch))
                        return;
                }
            }

        private:
            document const & doc_;
            viewer_options   opts_;
            navigator        nav_;
            curses_session   screen_;

            int content_rows() const { return std::max(LINES - 1, 1); }

            // Returns false when the viewer should close.
            bool handle(int ch)
            {
                switch (ch)
                {
                    case 'q':
                        return false;

                    case 3:     // Ctrl-C
                        throw interrupted{};

                    case 'n':
                        nav_.advance();
                        break;

                    case 'p':
                        nav_.retreat();
                        break;

                    case KEY_UP:
                        nav_.scroll_by(-1);
                        break;

                    case KEY_DOWN:
                        nav_.scroll_by(1);
                        break;

                    case KEY_PPAGE:
                        nav_.scroll_by(-content_rows());
                        break;

                    case KEY_NPAGE:
                        nav_.scroll_by(content_rows());
                        break;

                    case 's':
                        drop_to_shell();
                        break;

                    default:
                        break;
                }
                return true;
            }

            void drop_to_shell()
            {
                auto step = step_at(doc_, nav_.current_step());
                code_block const * code = step ? &step->get() : nullptr;

                curses_suspend suspended;
                std::cout << "\x1b[2J\x1b[1;1H";
                run_subshell(opts_.shell, code, std::cout);
                std::cout << "\nReturning to viewer...\n";
                std::cout.flush();
            }

//---------------------------------------------------------------------------

            void draw()
            {
                erase();

                auto lines = render_lines(doc_, nav_.current_step());
                int  rows  = content_rows();
                auto width = static_cast<size_t>(std::max(COLS, 1));

                for (int r = 0; r < rows; ++r)
                {
                    size_t index = nav_.scroll_offset() + static_cast<size_t>(r);
                    if (index >= lines.size())
                        break;
                    move(r, 0);
                    draw_line(lines[index], width);
                }

                if (auto text = nav_.active_notice(); text && LINES >= 2)
                {
                    move(LINES - 2, 0);
                    clrtoeol();
                    put(std::string(" ") + *text, screen_.colour(pair_notice) | A_BOLD, width);
                }

                draw_status(width);
                refresh();
            }

            void draw_status(size_t width)
            {
                auto text = viewer_status_text(nav_.current_step(), nav_.step_count());
                size_t used = columns(text);
                size_t pad  = used < width ? (width - used) / 2 : 0;

                attr_t a = screen_.colour(pair_status) | A_BOLD;
                move(LINES - 1, 0);
                attron(a);
                for (size_t i = 0; i < width; ++i)
                    addch(' ');
                mvaddstr(LINES - 1, static_cast<int>(pad), std::string(fit(text, width)).c_str());
                attroff(a);
            }

            // Writes at the cursor, clipped to what is left of the row.
            void put(std::string_view text, attr_t a, size_t width)
            {
                int y = 0, x = 0;
                getyx(stdscr, y, x);
                (void)y;

                auto left = width > static_cast<size_t>(x) ? width - static_cast<size_t>(x) : 0;
                if (left == 0)
                    return;

                attron(a);
                addstr(std::string(fit(text, left)).c_str());
                attroff(a);
            }

            attr_t header_attr(unsigned level) const
            {
                switch (level)
                {
                    case 1:  return screen_.colour(pair_header1) | A_BOLD | A_UNDERLINE;
                    case 2:  return screen_.colour(pair_header2) | A_BOLD;
                    default: return screen_.colour(pair_header) | A_BOLD;
                }
            }

            attr_t status_attr(step_status s) const
            {
                switch (s)
                {
                    case step_status::done:    return screen_.colour(pair_green) | A_BOLD;
                    case step_status::current: return screen_.colour(pair_yellow) | A_BOLD;
                    default:                   return A_DIM;
                }
            }

            attr_t code_attr(step_status s) const
            {
                switch (s)
                {
                    case step_status::current: return screen_.colour(pair_green) | A_BOLD;
                    case step_status::done:    return screen_.colour(pair_green) | A_DIM;
                    default:                   return A_DIM;
                }
            }

            void draw_line(layout_line const & line, size_t width)
            {
                switch (line.kind)
                {
                    case line_kind::blank:
                        break;

                    case line_kind::header:
                        put(line.text, header_attr(line.header_level), width);
                        break;

                    case line_kind::text:
                        draw_text(line, width);
                        break;

                    case line_kind::step_header:
                    {
                        const char * marker = line.status == step_status::done    ? icon::done
                                            : line.status == step_status::current ? icon::current
                                            :                                       icon::pending;
                        put(marker, status_attr(line.status), width);
                        put(line.text, status_attr(line.status), width);
                        if (line.dangerous)
                        {
                            put(" ", A_NORMAL, width);
                            put(icon::danger, screen_.colour(pair_red) | A_BOLD, width);
                        }
                        break;
                    }

                    case line_kind::code:
                        draw_code(line, width);
                        break;
                }
            }

            void draw_text(layout_line const & line, size_t width)
            {
                switch (line.note)
                {
                    case callout::warning:
                        put(icon::warning, screen_.colour(pair_yellow) | A_BOLD, width);
                        put(line.text, screen_.colour(pair_yellow) | A_BOLD, width);
                        break;

                    case callout::danger:
                        put(icon::danger, screen_.colour(pair_red) | A_BOLD | A_UNDERLINE, width);
                        put(line.text, screen_.colour(pair_red) | A_BOLD, width);
                        break;

                    case callout::info:
                        put(icon::info, screen_.colour(pair_blue), width);
                        put(line.text, A_NORMAL, width);
                        break;

                    case callout::none:
                        put(line.text, A_NORMAL, width);
                        break;
                }
            }

            void draw_code(layout_line const & line, size_t width)
            {
                bool current = line.status == step_status::current;
                attr_t base  = code_attr(line.status);

                put(current ? icon::heavy : icon::bar,
                    current ? screen_.colour(pair_yellow) : status_attr(line.status),
                    width);

                for (auto const & span : highlight_code_line(line.text, line.language))
                {
                    switch (span.style)
                    {
                        case span_style::comment:
                            put(span.text, A_DIM, width);
                            break;
                        case span_style::variable:
                            put(span.text, screen_.colour(pair_cyan) | A_BOLD, width);
                            break;
                        case span_style::danger:
                            put(span.text, screen_.colour(pair_red), width);
                            break;
                        case span_style::plain:
                            put(span.text, base, width);
                            break;
                    }
                }
            }
        };
    }

//---------------------------------------------------------------------------

    std::string viewer_status_text(size_t current_step, size_t step_count)
    {
        if (step_count == 0)
            return " No executable steps | q: Quit ";

        if (current_step >= step_count)
            return " Final step complete! Press 'q' to quit or 'p' to review. ";

        return " Step " + std::to_string(current_step) + "/" + std::to_string(step_count)
             + " | \xE2\x86\x91\xE2\x86\x93: Scroll | n: Next | p: Previous | s: Shell | q: Quit ";
    }

    void run_viewer(document const & doc, viewer_options opts)
    {
        if (!is_tty(STDOUT_FILENO))
        {
            log::debug("standard output is not a terminal; writing markdown");
            write_markdown(std::cout, doc);
            return;
        }

        log::scoped_level quiet(log::level::off);
        viewer v(doc, std::move(opts));
        v.run();
    }

} // namespace rbk
