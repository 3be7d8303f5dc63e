// rbk_log.hpp - Runbook (rbk) - Diagnostic Log
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_LOG_HPP
#define RBK_LOG_HPP

#include <iostream>
#include <string>

namespace rbk::log
{
    enum class level
    {
        debug,
        info,
        warn,
        error,
        off
    };

    namespace detail
    {
        inline level & threshold()
        {
            static level current = level::warn;
            return current;
        }

        inline const char * label(level l)
        {
            switch (l)
            {
                case level::debug: return "DEBUG";
                case level::info:  return "INFO";
                case level::warn:  return "WARN";
                case level::error: return "ERROR";
                default:           return "";
            }
        }

        inline void emit(level l, std::string const & msg)
        {
            if (threshold() == level::off || l < threshold())
                return;
            std::cerr << "[" << label(l) << "] " << msg << "\n";
        }
    }

    inline void  set_level(level l) { detail::threshold() = l; }
    inline level get_level()        { return detail::threshold(); }

    inline void debug(std::string const & msg) { detail::emit(level::debug, msg); }
    inline void info(std::string const & msg)  { detail::emit(level::info, msg); }
    inline void warn(std::string const & msg)  { detail::emit(level::warn, msg); }
    inline void error(std::string const & msg) { detail::emit(level::error, msg); }

    // Silences the log for the lifetime of the guard, e.g. while a
    // full-screen session owns the terminal.
    class scoped_level
    {
    public:
        explicit scoped_level(level l) : saved_(get_level()) { set_level(l); }
        ~scoped_level() { set_level(saved_); }

        scoped_level(scoped_level const &) = delete;
        scoped_level & operator=(scoped_level const &) = delete;

    private:
        level saved_;
    };

} // namespace rbk::log

#endif // RBK_LOG_HPP
