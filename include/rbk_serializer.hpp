// rbk_serializer.hpp - Runbook (rbk) - Serializer
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_SERIALIZER_HPP
#define RBK_SERIALIZER_HPP

#include "rbk_core.hpp"
#include "rbk_document.hpp"
#include "rbk_steps.hpp"

#include <ostream>
#include <sstream>

namespace rbk
{
    //========================================================================
    // SERIALIZER API
    //========================================================================

    // Step listing: "Dry run - N steps found:" followed by every step with
    // its content indented two spaces.
    void        write_dry_run(std::ostream & out, document const & doc);
    std::string serialize_dry_run(document const & doc);

    // Plain markdown rendition of the compiled document. Untagged fences
    // come back as text, so this is readable rather than source-identical.
    void        write_markdown(std::ostream & out, document const & doc);
    std::string serialize_markdown(document const & doc);

    //========================================================================
    // SERIALIZER IMPLEMENTATION
    //========================================================================

    namespace detail
    {
        class serializer_impl
        {
        public:
            explicit serializer_impl(std::ostream & out) : out_(out) {}

            void dry_run(document const & doc)
            {
                out_ << "Dry run - " << step_count(doc) << " steps found:\n\n";

                for_each_step(doc, [&](code_block const & code, step_location loc)
                {
                    out_ << "Step " << loc.number << " [" << code.language << "]:\n";
                    for (auto line : split_lines(code.content))
                        out_ << "  " << line << "\n";
                    out_ << "\n";
                    return true;
                });
            }

            void markdown(document const & doc)
            {
                bool first_section = true;
                for (auto const & s : doc.sections())
                {
                    if (!first_section)
                        out_ << "\n";
                    first_section = false;

                    write_section(s);
                }
            }

        private:
            std::ostream & out_;

            void write_section(section const & s)
            {
                bool first_block = true;

                if (s.header)
                {
                    out_ << std::string(s.header_level.value_or(1), '#') << " " << *s.header << "\n";
                    first_block = false;
                }

                for (auto const & b : s.blocks)
                {
                    if (!first_block)
                        out_ << "\n";
                    first_block = false;

                    std::visit([&](auto const & blk) { write_block(blk); }, b);
                }
            }

            void write_block(text_block const & text)
            {
                auto body = trim_right(text.content);
                while (!body.empty() && body.front() == '\n')
                    body.remove_prefix(1);
                out_ << body << "\n";
            }

            void write_block(code_block const & code)
            {
                out_ << "```" << code.language << "\n";
                if (!code.content.empty())
                    out_ << code.content << "\n";
                out_ << "```\n";
            }
        };
    }

    inline void write_dry_run(std::ostream & out, document const & doc)
    {
        detail::serializer_impl(out).dry_run(doc);
    }

    inline std::string serialize_dry_run(document const & doc)
    {
        std::ostringstream out;
        write_dry_run(out, doc);
        return out.str();
    }

    inline void write_markdown(std::ostream & out, document const & doc)
    {
        detail::serializer_impl(out).markdown(doc);
    }

    inline std::string serialize_markdown(document const & doc)
    {
        std::ostringstream out;
        write_markdown(out, doc);
        return out.str();
    }

} // namespace rbk

#endif // RBK_SERIALIZER_HPP
