// rbk_steps.hpp - Runbook (rbk) - Step Index
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_STEPS_HPP
#define RBK_STEPS_HPP

#include "rbk_document.hpp"

#include <functional>

namespace rbk
{
    //========================================================================
    // STEP INDEX API
    //========================================================================

    // Steps are the document's code blocks in document order, numbered
    // from 1. The index is recomputed on every call and never cached, so
    // it cannot drift from the sections it is derived from.

    using step_ref = std::reference_wrapper<const code_block>;

    std::vector<step_ref>   steps(document const & doc);
    size_t                  step_count(document const & doc);
    std::optional<step_ref> step_at(document const & doc, size_t number);

    // Where a step sits in the section/block tree.
    struct step_location
    {
        size_t number;      // 1-based
        size_t section;
        size_t block;
    };

    std::vector<step_location> step_locations(document const & doc);

    //========================================================================
    // STEP INDEX IMPLEMENTATION
    //========================================================================

    namespace detail
    {
        template <typename F>
        void for_each_step(document const & doc, F && fn)
        {
            size_t number = 0;
            auto sections = doc.sections();
            for (size_t s = 0; s < sections.size(); ++s)
            {
                auto const & blocks = sections[s].blocks;
                for (size_t b = 0; b < blocks.size(); ++b)
                {
                    if (auto const * code = std::get_if<code_block>(&blocks[b]))
                    {
                        ++number;
                        if (!fn(*code, step_location{ number, s, b }))
                            return;
                    }
                }
            }
        }
    }

    inline std::vector<step_ref> steps(document const & doc)
    {
        std::vector<step_ref> out;
        detail::for_each_step(doc, [&](code_block const & code, step_location)
        {
            out.push_back(std::cref(code));
            return true;
        });
        return out;
    }

    inline size_t step_count(document const & doc)
    {
        size_t n = 0;
        detail::for_each_step(doc, [&](code_block const &, step_location)
        {
            ++n;
            return true;
        });
        return n;
    }

    inline std::optional<step_ref> step_at(document const & doc, size_t number)
    {
        std::optional<step_ref> found;
        if (number == 0)
            return found;

        detail::for_each_step(doc, [&](code_block const & code, step_location loc)
        {
            if (loc.number != number)
                return true;
            found = std::cref(code);
            return false;
        });
        return found;
    }

    inline std::vector<step_location> step_locations(document const & doc)
    {
        std::vector<step_location> out;
        detail::for_each_step(doc, [&](code_block const &, step_location loc)
        {
            out.push_back(loc);
            return true;
        });
        return out;
    }

//---------------------------------------------------------------------------

    inline std::vector<step_ref> document::code_blocks() const
    {
        return rbk::steps(*this);
    }

    inline size_t document::step_count() const
    {
        return rbk::step_count(*this);
    }

} // namespace rbk

#endif // RBK_STEPS_HPP
