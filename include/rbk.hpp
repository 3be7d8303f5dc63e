// rbk.hpp - Runbook (rbk)
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

//========================================================================
// Runbook Core Principles:
//========================================================================
//
// The Authored-Order Principle
// ----------------------------
// A runbook is read top to bottom. Steps are its tagged code blocks in
// the order they were written, and nothing reorders them.
//
//
// The Recoverability Principle
// ----------------------------
// Malformed markdown is normalised, not rejected.
// Anomalies are reported next to the document, never instead of it.
// A broken runbook is still a runbook.
//
//
// The Derived-View Principle
// --------------------------
// The section list is the only source of truth. Step numbers, layout
// lines and scroll offsets are recomputed from it on demand.
//
//========================================================================


#ifndef RBK_RUNBOOK
#define RBK_RUNBOOK

#include "rbk_core.hpp"
#include "rbk_tokenizer.hpp"
#include "rbk_compiler.hpp"
#include "rbk_document.hpp"
#include "rbk_steps.hpp"

namespace rbk
{
//========================================================================
// Document creation errors
//========================================================================

    using any_error = std::variant<error<tokenize_error_kind>, error<compile_error_kind>>;

    using doc_context = context<document, any_error>;
    doc_context load(std::string_view text, compile_options opt = {});

    inline bool is_tokenize_error(any_error const & e) { return std::holds_alternative<error<tokenize_error_kind>>(e); }
    inline bool is_compile_error(any_error const & e)  { return std::holds_alternative<error<compile_error_kind>>(e); }

    inline tokenize_error_kind get_tokenize_error(any_error const & e) { return std::get<error<tokenize_error_kind>>(e).kind; }
    inline compile_error_kind  get_compile_error(any_error const & e)  { return std::get<error<compile_error_kind>>(e).kind; }

    // "line N: message", or just the message when the line is unknown.
    inline std::string describe(any_error const & e)
    {
        return std::visit([](auto const & err)
        {
            if (err.loc.line == 0)
                return err.message;
            return "line " + std::to_string(err.loc.line) + ": " + err.message;
        }, e);
    }

    inline doc_context load(std::string_view src, compile_options opt)
    {
        doc_context out{};

        auto tok_ctx = tokenize(src);
        auto cmp_ctx = compile(tok_ctx.document.events, std::move(opt));
        out.document = std::move(cmp_ctx.document);

        out.errors.reserve(tok_ctx.errors.size() + cmp_ctx.errors.size());

        for (auto const & te : tok_ctx.errors)
            out.errors.push_back(te);

        for (auto const & ce : cmp_ctx.errors)
            out.errors.push_back(ce);

        return out;
    }

}

#endif
