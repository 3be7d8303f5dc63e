// rbk_navigation.hpp - Runbook (rbk) - Step Navigation
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

// Navigation rules:
// * Current step runs 0..=N. 0 is "nothing executed yet", N is terminal.
// * Every step change replays the layout from the top. Offsets are never
//   cached per step.
// * Navigation never fails. Out-of-range requests are clamped.

#ifndef RBK_NAVIGATION_HPP
#define RBK_NAVIGATION_HPP

#include "rbk_core.hpp"
#include "rbk_document.hpp"
#include "rbk_steps.hpp"
#include "rbk_layout.hpp"

#include <chrono>

namespace rbk
{
    using clock_type = std::chrono::steady_clock;

    struct navigation_options
    {
        size_t                    lookback    = 5;
        std::chrono::milliseconds notice_ttl  = std::chrono::seconds(4);
        std::string               end_message = "\xF0\x9F\x8E\x89 You\xE2\x80\x99ve reached the final step! Press 'q' to quit or 'p' to go back.";
    };

    struct transient_notice
    {
        std::string            text;
        clock_type::time_point created;
    };

//========================================================================
// navigator
//========================================================================

    class navigator
    {
    public:
        explicit navigator(document const & doc, navigation_options opts = {});

        void advance(clock_type::time_point now = clock_type::now());
        void retreat();
        void jump_to(size_t offset);
        void scroll_by(std::ptrdiff_t delta);

        size_t current_step()  const noexcept { return current_; }
        size_t scroll_offset() const noexcept { return offset_; }
        size_t step_count()    const noexcept { return total_steps_; }
        size_t line_count()    const noexcept { return total_lines_; }
        bool   at_end()        const noexcept { return total_steps_ > 0 && current_ == total_steps_; }

        std::optional<transient_notice> const & notice() const noexcept { return notice_; }

        // Notice text while younger than the TTL, otherwise nothing.
        std::optional<std::string> active_notice(clock_type::time_point now = clock_type::now()) const;

        // Drops a stale notice; returns true if one was removed.
        bool expire_notice(clock_type::time_point now = clock_type::now());

        navigation_options const & options() const noexcept { return opts_; }

    private:
        document const &   doc_;
        navigation_options opts_;

        size_t total_steps_;
        size_t total_lines_;    // clamp bound for manual scrolling only

        size_t current_      {0};
        size_t offset_       {0};
        bool   notice_armed_ {true};

        std::optional<transient_notice> notice_;

        void sync_offset();
        size_t max_offset() const noexcept { return total_lines_ > 0 ? total_lines_ - 1 : 0; }
    };

//========================================================================
// Implementation
//========================================================================

    inline navigator::navigator(document const & doc, navigation_options opts)
        : doc_(doc)
        , opts_(std::move(opts))
        , total_steps_(rbk::step_count(doc))
        , total_lines_(layout_line_count(doc))
    {
    }

    inline void navigator::sync_offset()
    {
        offset_ = scroll_offset_for_step(doc_, current_, opts_.lookback);
    }

//---------------------------------------------------------------------------

    inline void navigator::advance(clock_type::time_point now)
    {
        if (current_ < total_steps_)
        {
            ++current_;
            sync_offset();
            return;
        }

        if (total_steps_ == 0 || !notice_armed_)
            return;

        notice_       = transient_notice{ opts_.end_message, now };
        notice_armed_ = false;
    }

    inline void navigator::retreat()
    {
        if (current_ == 0)
            return;

        --current_;
        sync_offset();
        notice_armed_ = true;
    }

//---------------------------------------------------------------------------

    inline void navigator::jump_to(size_t offset)
    {
        offset_ = std::min(offset, max_offset());
    }

    inline void navigator::scroll_by(std::ptrdiff_t delta)
    {
        if (delta < 0)
        {
            auto back = static_cast<size_t>(-delta);
            offset_ = back > offset_ ? 0 : offset_ - back;
            return;
        }

        auto forward = static_cast<size_t>(delta);
        jump_to(forward > max_offset() - std::min(offset_, max_offset())
                    ? max_offset()
                    : offset_ + forward);
    }

//---------------------------------------------------------------------------

    inline std::optional<std::string> navigator::active_notice(clock_type::time_point now) const
    {
        if (!notice_ || now - notice_->created >= opts_.notice_ttl)
            return std::nullopt;
        return notice_->text;
    }

    inline bool navigator::expire_notice(clock_type::time_point now)
    {
        if (!notice_ || now - notice_->created < opts_.notice_ttl)
            return false;
        notice_.reset();
        return true;
    }

} // namespace rbk

#endif // RBK_NAVIGATION_HPP
