// walker.cpp - Runbook (rbk) - Linear Walker
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#include "walker.hpp"
#include "rbk_core.hpp"
#include "rbk_log.hpp"

namespace rbk
{
    namespace
    {
        std::string_view header_colour(unsigned level)
        {
            switch (level)
            {
                case 1:  return ansi::cyan;
                case 2:  return ansi::blue;
                default: return ansi::white;
            }
        }

        class walker
        {
        public:
            walker(document const & doc, key_source & keys, std::ostream & out, walker_options opts)
                : doc_(doc), keys_(keys), out_(out), opts_(std::move(opts)), nav_(doc)
            {
            }

            size_t run()
            {
                for (auto const & s : doc_.sections())
                {
                    if (s.header)
                        print_header(*s.header, s.header_level.value_or(1));

                    for (auto const & b : s.blocks)
                    {
                        if (auto const * text = std::get_if<text_block>(&b))
                        {
                            print_text(*text);
                            continue;
                        }

                        auto const & code = std::get<code_block>(b);
                        print_step(code);
                        wait_for_continue(code);
                    }
                }

                out_ << "\n" << ansi::paint("\xE2\x9C\x93 All steps completed!", ansi::green, opts_.colour) << "\n\n";
                out_.flush();
                return nav_.current_step();
            }

        private:
            document const & doc_;
            key_source &     keys_;
            std::ostream &   out_;
            walker_options   opts_;
            navigator        nav_;

            void print_header(std::string const & header, unsigned level)
            {
                out_ << "\n"
                     << ansi::paint(std::string(level, '#') + " " + header, header_colour(level), opts_.colour)
                     << "\n\n";
            }

            void print_text(text_block const & text)
            {
                for (auto line : detail::split_lines(text.content))
                {
                    if (!detail::is_blank(line))
                        out_ << line << "\n";
                }
            }

            void print_step(code_block const & code)
            {
                // the step on screen is the one after the last confirmed
                std::string title = "Step " + std::to_string(nav_.current_step() + 1)
                                  + "/" + std::to_string(nav_.step_count())
                                  + " [" + code.language + "]:";

                out_ << "\n" << ansi::paint(title, ansi::yellow, opts_.colour) << "\n";

                std::string body;
                for (auto line : detail::split_lines(code.content))
                {
                    body += "  ";
                    body += line;
                    body += "\n";
                }
                out_ << ansi::paint(body, ansi::green, opts_.colour) << "\n";
            }

            void prompt()
            {
                out_ << "Press Enter to continue, 's' for a shell, Ctrl-C to abort.\n";
                out_.flush();
            }

            void wait_for_continue(code_block const & code)
            {
                prompt();

                for (;;)
                {
                    auto k = keys_.read_key();

                    switch (k.code)
                    {
                        case key::enter:
                        case key::end_of_input:
                            nav_.advance();
                            log::debug("step " + std::to_string(nav_.current_step()) + " confirmed");
                            return;

                        case key::interrupt:
                            out_ << "\n\nInterrupted.\n";
                            out_.flush();
                            throw interrupted{};

                        default:
                            break;
                    }

                    if (k.is('s'))
                    {
                        if (opts_.drop_to_shell)
                            opts_.drop_to_shell(code);
                        else
                            run_subshell(opts_.shell, &code, out_);
                        prompt();
                    }
                }
            }
        };
    }

//---------------------------------------------------------------------------

    size_t run_walker(document const & doc,
                      key_source & keys,
                      std::ostream & out,
                      walker_options opts)
    {
        walker w(doc, keys, out, std::move(opts));
        return w.run();
    }

} // namespace rbk
