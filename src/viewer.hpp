// viewer.hpp - Runbook (rbk) - Full-screen Viewer
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_VIEWER_HPP
#define RBK_VIEWER_HPP

#include "rbk_document.hpp"
#include "rbk_navigation.hpp"
#include "subshell.hpp"

#include <chrono>
#include <string>

namespace rbk
{
    struct viewer_options
    {
        bool                      colour = true;
        std::string               shell  = fallback_shell;
        navigation_options        navigation;
        std::chrono::milliseconds poll   = std::chrono::milliseconds(100);
    };

    // Status bar text for the given position.
    std::string viewer_status_text(size_t current_step, size_t step_count);

    // Scrollable view of the whole runbook over a one-line status bar.
    // Keys: n/p next and previous step, Up/Down and PgUp/PgDn scroll,
    // s shell, q quit, Ctrl-C throws interrupted.
    //
    // When standard output is not a terminal the document is written as
    // markdown instead.
    void run_viewer(document const & doc, viewer_options opts = {});

} // namespace rbk

#endif // RBK_VIEWER_HPP
