// subshell.hpp - Runbook (rbk) - Operator Sub-shell
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_SUBSHELL_HPP
#define RBK_SUBSHELL_HPP

#include "rbk_document.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace rbk
{
    inline constexpr const char * fallback_shell = "/bin/bash";

    // $SHELL, or /bin/bash when unset or empty.
    std::string default_shell();

    // Prints the step (when there is one) between rules of '=' and runs
    // `shell` with inherited stdio until it exits. The parent ignores
    // SIGINT and SIGQUIT meanwhile. `args` follow argv[0]; an interactive
    // session passes none.
    //
    // Throws interrupted when the shell exits with status 130 or dies by
    // SIGINT, and std::system_error when the process cannot be created.
    void run_subshell(std::string const & shell,
                      code_block const * step,
                      std::ostream & out,
                      std::vector<std::string> const & args = {});

} // namespace rbk

#endif // RBK_SUBSHELL_HPP
