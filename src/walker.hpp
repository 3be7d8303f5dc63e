// walker.hpp - Runbook (rbk) - Linear Walker
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_WALKER_HPP
#define RBK_WALKER_HPP

#include "rbk_document.hpp"
#include "rbk_navigation.hpp"
#include "subshell.hpp"
#include "terminal.hpp"

#include <functional>
#include <ostream>
#include <string>

namespace rbk
{
    struct walker_options
    {
        bool        colour = true;
        std::string shell  = fallback_shell;

        // Replaces the interactive sub-shell when set.
        std::function<void(code_block const &)> drop_to_shell;
    };

    // Prints the runbook top to bottom and stops after every step until
    // the operator confirms it (Enter or Ctrl-D). 's' opens a shell and
    // asks again. Ctrl-C prints "Interrupted." and throws interrupted.
    //
    // Returns the number of confirmed steps.
    size_t run_walker(document const & doc,
                      key_source & keys,
                      std::ostream & out,
                      walker_options opts = {});

} // namespace rbk

#endif // RBK_WALKER_HPP
