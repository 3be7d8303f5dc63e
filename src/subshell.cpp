// subshell.cpp - Runbook (rbk) - Operator Sub-shell
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#include "subshell.hpp"
#include "terminal.hpp"
#include "rbk_core.hpp"
#include "rbk_log.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>

namespace rbk
{
    namespace
    {
        constexpr size_t rule_width = 60;

        // Ignores a signal in this process for the guard's lifetime.
        class ignore_signal
        {
        public:
            explicit ignore_signal(int sig) : sig_(sig)
            {
                struct sigaction ign {};
                ign.sa_handler = SIG_IGN;
                sigemptyset(&ign.sa_mask);
                ::sigaction(sig_, &ign, &saved_);
            }

            ~ignore_signal() { ::sigaction(sig_, &saved_, nullptr); }

            ignore_signal(ignore_signal const &) = delete;
            ignore_signal & operator=(ignore_signal const &) = delete;

        private:
            int              sig_;
            struct sigaction saved_ {};
        };

        void print_step(code_block const * step, std::ostream & out)
        {
            if (step != nullptr)
            {
                std::string rule(rule_width, '=');
                out << rule << "\n";
                out << "Current step [" << step->language << "]:\n";
                for (auto line : detail::split_lines(step->content))
                    out << "  " << line << "\n";
                out << rule << "\n";
            }
            out << "\nDropping to shell. Type 'exit' or press Ctrl-D to return.\n\n";
            out.flush();
        }

        int spawn_and_wait(std::string const & shell, std::vector<std::string> const & args)
        {
            std::vector<char *> argv;
            argv.push_back(const_cast<char *>(shell.c_str()));
            for (auto const & a : args)
                argv.push_back(const_cast<char *>(a.c_str()));
            argv.push_back(nullptr);

            pid_t pid = ::fork();
            if (pid < 0)
                throw std::system_error(errno, std::generic_category(), "starting " + shell);

            if (pid == 0)
            {
                // Child: the operator expects Ctrl-C to reach the shell.
                ::signal(SIGINT, SIG_DFL);
                ::signal(SIGQUIT, SIG_DFL);
                ::execvp(argv[0], argv.data());
                _exit(127);
            }

            int status = 0;
            while (::waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                    throw std::system_error(errno, std::generic_category(), "waiting for " + shell);
            }
            return status;
        }
    }

//---------------------------------------------------------------------------

    std::string default_shell()
    {
        const char * shell = std::getenv("SHELL");
        if (shell == nullptr || *shell == '\0')
            return fallback_shell;
        return shell;
    }

    void run_subshell(std::string const & shell,
                      code_block const * step,
                      std::ostream & out,
                      std::vector<std::string> const & args)
    {
        print_step(step, out);

        int status = 0;
        {
            ignore_signal no_int(SIGINT);
            ignore_signal no_quit(SIGQUIT);
            status = spawn_and_wait(shell, args);
        }

        if (WIFSIGNALED(status) && WTERMSIG(status) == SIGINT)
            throw interrupted{};

        if (WIFEXITED(status))
        {
            int code = WEXITSTATUS(status);
            if (code == interrupted_exit_status)
                throw interrupted{};
            if (code == 127)
                log::warn("could not run shell '" + shell + "'");
            else
                log::debug("shell exited with status " + std::to_string(code));
        }
    }

} // namespace rbk
