// terminal.hpp - Runbook (rbk) - Terminal Input and Colour
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_TERMINAL_HPP
#define RBK_TERMINAL_HPP

#include <termios.h>

#include <deque>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>

namespace rbk
{
//========================================================================
// Forced interrupt
//========================================================================

    // Raised when the operator aborts the session (Ctrl-C, or a sub-shell
    // that ended with status 130). main() turns it into exit status 130.
    struct interrupted : std::exception
    {
        const char * what() const noexcept override { return "interrupted"; }
    };

    inline constexpr int interrupted_exit_status = 130;

//========================================================================
// Keys
//========================================================================

    enum class key
    {
        none,
        enter,
        end_of_input,   // Ctrl-D, or stdin closed
        interrupt,      // Ctrl-C
        up,
        down,
        page_up,
        page_down,
        character,
    };

    struct key_press
    {
        key  code = key::none;
        char ch   = 0;      // key::character only

        bool is(char c) const { return code == key::character && ch == c; }
    };

    class key_source
    {
    public:
        virtual ~key_source() = default;

        // Blocks until a key is available.
        virtual key_press read_key() = 0;
    };

    // Raw keyboard on standard input. Raw mode is held only while a key
    // is being read, so output in between behaves normally.
    class terminal_key_source : public key_source
    {
    public:
        key_press read_key() override;
    };

    // Replays a fixed sequence, then reports end of input forever.
    class scripted_key_source : public key_source
    {
    public:
        scripted_key_source() = default;
        scripted_key_source(std::initializer_list<key_press> keys) : keys_(keys) {}

        void push(key_press k) { keys_.push_back(k); }
        size_t remaining() const { return keys_.size(); }

        key_press read_key() override;

    private:
        std::deque<key_press> keys_;
    };

    inline key_press press(char c)  { return { key::character, c }; }
    inline key_press press(key k)   { return { k, 0 }; }

//========================================================================
// Terminal state
//========================================================================

    bool is_tty(int fd);

    // Non-canonical, no echo, no signal generation. Restores the saved
    // attributes on destruction. A no-op when fd is not a terminal.
    class raw_mode_guard
    {
    public:
        explicit raw_mode_guard(int fd);
        ~raw_mode_guard();

        raw_mode_guard(raw_mode_guard const &) = delete;
        raw_mode_guard & operator=(raw_mode_guard const &) = delete;

        bool active() const { return active_; }

    private:
        int     fd_;
        termios saved_ {};
        bool    active_ {false};
    };

//========================================================================
// ANSI colour
//========================================================================

    namespace ansi
    {
        constexpr std::string_view reset  = "\x1b[0m";
        constexpr std::string_view red    = "\x1b[31m";
        constexpr std::string_view green  = "\x1b[32m";
        constexpr std::string_view yellow = "\x1b[33m";
        constexpr std::string_view blue   = "\x1b[34m";
        constexpr std::string_view cyan   = "\x1b[36m";
        constexpr std::string_view white  = "\x1b[37m";

        std::string paint(std::string_view text, std::string_view colour, bool enabled);
    }

} // namespace rbk

#endif // RBK_TERMINAL_HPP
