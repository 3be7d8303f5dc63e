// terminal.cpp - Runbook (rbk) - Terminal Input and Colour
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#include "terminal.hpp"

#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace rbk
{
    namespace
    {
        // Returns false on end of input.
        bool read_byte(int fd, char & c)
        {
            for (;;)
            {
                ssize_t n = ::read(fd, &c, 1);
                if (n == 1)
                    return true;
                if (n == 0)
                    return false;
                if (errno != EINTR)
                    throw std::system_error(errno, std::generic_category(), "reading keyboard input");
            }
        }

        // After ESC '[': "A" up, "B" down, "5~" page up, "6~" page down.
        key_press read_escape(int fd)
        {
            char c = 0;
            if (!read_byte(fd, c) || c != '[')
                return press(key::none);
            if (!read_byte(fd, c))
                return press(key::none);

            switch (c)
            {
                case 'A': return press(key::up);
                case 'B': return press(key::down);
                case '5':
                case '6':
                {
                    char tilde = 0;
                    if (!read_byte(fd, tilde) || tilde != '~')
                        return press(key::none);
                    return press(c == '5' ? key::page_up : key::page_down);
                }
                default:
                    return press(key::none);
            }
        }
    }

//---------------------------------------------------------------------------

    bool is_tty(int fd)
    {
        return ::isatty(fd) == 1;
    }

    raw_mode_guard::raw_mode_guard(int fd)
        : fd_(fd)
    {
        if (!is_tty(fd_))
            return;

        if (::tcgetattr(fd_, &saved_) != 0)
            throw std::system_error(errno, std::generic_category(), "reading terminal attributes");

        termios raw = saved_;
        raw.c_lflag &= ~(ICANON | ECHO | ISIG);
        raw.c_cc[VMIN]  = 1;
        raw.c_cc[VTIME] = 0;

        if (::tcsetattr(fd_, TCSANOW, &raw) != 0)
            throw std::system_error(errno, std::generic_category(), "entering raw terminal mode");

        active_ = true;
    }

    raw_mode_guard::~raw_mode_guard()
    {
        if (active_)
            ::tcsetattr(fd_, TCSANOW, &saved_);
    }

//---------------------------------------------------------------------------

    key_press terminal_key_source::read_key()
    {
        raw_mode_guard raw(STDIN_FILENO);

        for (;;)
        {
            char c = 0;
            if (!read_byte(STDIN_FILENO, c))
                return press(key::end_of_input);

            switch (c)
            {
                case '\r':
                case '\n':
                    return press(key::enter);
                case 0x03:
                    return press(key::interrupt);
                case 0x04:
                    return press(key::end_of_input);
                case 0x1b:
                {
                    auto k = read_escape(STDIN_FILENO);
                    if (k.code != key::none)
                        return k;
                    break;
                }
                default:
                    return press(c);
            }
        }
    }

    key_press scripted_key_source::read_key()
    {
        if (keys_.empty())
            return press(key::end_of_input);

        key_press k = keys_.front();
        keys_.pop_front();
        return k;
    }

//---------------------------------------------------------------------------

    std::string ansi::paint(std::string_view text, std::string_view colour, bool enabled)
    {
        if (!enabled)
            return std::string(text);

        std::string out;
        out.reserve(text.size() + colour.size() + reset.size());
        out.append(colour);
        out.append(text);
        out.append(reset);
        return out;
    }

} // namespace rbk
