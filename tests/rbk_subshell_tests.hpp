#ifndef RBK_TESTS_SUBSHELL__
#define RBK_TESTS_SUBSHELL__

#include "rbk_test_harness.hpp"
#include "rbk_steps_tests.hpp"
#include "../src/subshell.hpp"
#include "../src/file_io.hpp"
#include "../src/terminal.hpp"
#include "../include/rbk_log.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace rbk::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    // Sets an environment variable for the guard's lifetime.
    class scoped_env
    {
    public:
        scoped_env(char const * name, char const * value) : name_(name)
        {
            if (char const * old = std::getenv(name))
            {
                had_ = true;
                old_ = old;
            }
            if (value != nullptr)
                ::setenv(name, value, 1);
            else
                ::unsetenv(name);
        }

        ~scoped_env()
        {
            if (had_)
                ::setenv(name_, old_.c_str(), 1);
            else
                ::unsetenv(name_);
        }

    private:
        char const * name_;
        std::string  old_;
        bool         had_ = false;
    };

//------------------------------------------
// TESTS
//------------------------------------------

static bool test_subshell_prints_step_between_rules()
{
    auto step = code("bash", "make\nmake install");
    std::vector<std::string> args = { "-c", "exit 0" };
    std::ostringstream out;

    run_subshell("/bin/sh", &step, out, args);

    std::string rule(60, '=');
    EXPECT(out.str() ==
        rule + "\n"
        "Current step [bash]:\n"
        "  make\n"
        "  make install\n"
        + rule + "\n"
        "\nDropping to shell. Type 'exit' or press Ctrl-D to return.\n\n",
        "banner wrong");

    return true;
}

static bool test_subshell_without_step()
{
    std::vector<std::string> args = { "-c", "exit 3" };
    std::ostringstream out;

    run_subshell("/bin/sh", nullptr, out, args);
    EXPECT(out.str().find('=') == std::string::npos, "rule printed without a step");
    EXPECT(out.str().find("Dropping to shell.") != std::string::npos, "notice missing");

    return true;
}

static bool test_subshell_status_130_interrupts()
{
    std::vector<std::string> args = { "-c", "exit 130" };
    std::ostringstream out;

    EXPECT_THROWS(run_subshell("/bin/sh", nullptr, out, args), interrupted, "status 130 not an interrupt");

    return true;
}

static bool test_subshell_killed_by_sigint_interrupts()
{
    std::vector<std::string> args = { "-c", "kill -INT $$" };
    std::ostringstream out;

    EXPECT_THROWS(run_subshell("/bin/sh", nullptr, out, args), interrupted, "SIGINT death not an interrupt");

    return true;
}

static bool test_subshell_missing_program_is_not_fatal()
{
    log::scoped_level quiet(log::level::off);
    std::ostringstream out;

    run_subshell("/nonexistent/rbk-shell", nullptr, out);
    EXPECT(out.str().find("Dropping to shell.") != std::string::npos, "notice missing");

    return true;
}

static bool test_default_shell_honours_environment()
{
    {
        scoped_env env("SHELL", "/bin/zsh");
        EXPECT(default_shell() == "/bin/zsh", "$SHELL ignored");
    }
    {
        scoped_env env("SHELL", "");
        EXPECT(default_shell() == fallback_shell, "empty $SHELL used");
    }
    {
        scoped_env env("SHELL", nullptr);
        EXPECT(default_shell() == "/bin/bash", "fallback wrong");
    }

    return true;
}

static bool test_read_text_file_failures()
{
    EXPECT_THROWS(read_text_file("/nonexistent/runbook.md"), std::runtime_error, "missing file read");
    EXPECT_THROWS(read_text_file("/"), std::runtime_error, "directory read");

    try
    {
        read_text_file("/nonexistent/runbook.md");
    }
    catch (std::runtime_error const & e)
    {
        EXPECT(std::string(e.what()).find("Failed to read file: /nonexistent/runbook.md") == 0,
               "message does not name the file");
    }

    return true;
}

//------------------------------------------

inline void run_subshell_tests()
{
    SUBCAT("Sub-shell");
    RUN_TEST(test_subshell_prints_step_between_rules);
    RUN_TEST(test_subshell_without_step);
    RUN_TEST(test_subshell_status_130_interrupts);
    RUN_TEST(test_subshell_killed_by_sigint_interrupts);
    RUN_TEST(test_subshell_missing_program_is_not_fatal);
    RUN_TEST(test_default_shell_honours_environment);

    SUBCAT("Files");
    RUN_TEST(test_read_text_file_failures);
}

}

#endif
