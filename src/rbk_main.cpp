// rbk_main.cpp - Runbook (rbk) - Command Line
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#include "rbk.hpp"
#include "rbk_log.hpp"
#include "rbk_serializer.hpp"

#include "file_io.hpp"
#include "subshell.hpp"
#include "terminal.hpp"
#include "viewer.hpp"
#include "walker.hpp"

#include <unistd.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace
{
    constexpr const char * version = "0.1.0";

    bool has_flag(std::vector<std::string> const & args, std::string const & flag)
    {
        for (auto const & a : args)
        {
            if (a == flag)
                return true;
        }
        return false;
    }

    // Everything that does not start with "--" (or is "-h").
    std::vector<std::string> positionals(std::vector<std::string> const & args)
    {
        std::vector<std::string> out;
        for (auto const & a : args)
        {
            if (a.rfind("--", 0) == 0 || a == "-h")
                continue;
            out.push_back(a);
        }
        return out;
    }

    void print_usage(std::ostream & out)
    {
        out << "Usage: rbk <file.md>\n"
            << "       rbk run <file.md>\n"
            << "       rbk dry-run <file.md>\n"
            << "       rbk view <file.md>\n"
            << "\n"
            << "Options:\n"
            << "  --verbose   log diagnostics\n"
            << "  --quiet     log errors only\n"
            << "  --no-color  plain output\n"
            << "  --help      show this help\n"
            << "  --version   show the version\n";
    }

    enum class command
    {
        run,
        dry_run,
        view
    };

    rbk::document load_runbook(std::string const & path)
    {
        auto text = rbk::read_text_file(path);
        auto ctx  = rbk::load(text);

        for (auto const & e : ctx.errors)
            rbk::log::debug(path + ": " + rbk::describe(e));

        rbk::log::info(path + ": " + std::to_string(ctx.document.section_count()) + " sections, "
                       + std::to_string(rbk::step_count(ctx.document)) + " steps");

        return std::move(ctx.document);
    }

    int run_command(command cmd, std::string const & path, bool colour)
    {
        auto doc = load_runbook(path);

        switch (cmd)
        {
            case command::dry_run:
                rbk::write_dry_run(std::cout, doc);
                break;

            case command::view:
            {
                rbk::viewer_options opts;
                opts.colour = colour;
                opts.shell  = rbk::default_shell();
                rbk::run_viewer(doc, opts);
                break;
            }

            case command::run:
            {
                rbk::walker_options opts;
                opts.colour = colour && rbk::is_tty(STDOUT_FILENO);
                opts.shell  = rbk::default_shell();

                rbk::terminal_key_source keys;
                rbk::run_walker(doc, keys, std::cout, opts);
                break;
            }
        }

        return 0;
    }
}

int main(int argc, char ** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    if (has_flag(args, "--version"))
    {
        std::cout << "rbk " << version << "\n";
        return 0;
    }

    if (has_flag(args, "--help") || has_flag(args, "-h"))
    {
        print_usage(std::cout);
        return 0;
    }

    if (has_flag(args, "--verbose"))
        rbk::log::set_level(rbk::log::level::debug);
    else if (has_flag(args, "--quiet"))
        rbk::log::set_level(rbk::log::level::error);

    bool colour = !has_flag(args, "--no-color");

    auto pos = positionals(args);
    command cmd = command::run;

    if (!pos.empty())
    {
        if (pos.front() == "run")
        {
            pos.erase(pos.begin());
        }
        else if (pos.front() == "dry-run")
        {
            cmd = command::dry_run;
            pos.erase(pos.begin());
        }
        else if (pos.front() == "view")
        {
            cmd = command::view;
            pos.erase(pos.begin());
        }
    }

    if (pos.empty())
    {
        std::cerr << "Error: No file specified\n\n";
        print_usage(std::cerr);
        return 1;
    }

    if (pos.size() > 1)
        rbk::log::warn("ignoring extra arguments after " + pos.front());

    try
    {
        return run_command(cmd, pos.front(), colour);
    }
    catch (rbk::interrupted const &)
    {
        return rbk::interrupted_exit_status;
    }
    catch (std::exception const & e)
    {
        rbk::log::error(e.what());
        return 1;
    }
}
