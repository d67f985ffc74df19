#pragma once

#include <chrono>
#include <optional>

namespace querygraph {

inline constexpr std::chrono::milliseconds kDefaultDebounceInterval{500};
inline constexpr std::chrono::milliseconds kMinDebounceInterval{400};
inline constexpr std::chrono::milliseconds kMaxDebounceInterval{800};

// ---------------------------------------------------------------------------
// Debouncer: cooperative single-shot timer.
//
// Schedule() (re)arms the timer; a pending deadline is replaced, never
// stacked. Poll() returns true exactly once, on the first call at or after
// the deadline, and disarms the timer. Time is passed in by the caller so
// the owner decides which clock drives it.
// ---------------------------------------------------------------------------
class Debouncer {
public:
    using Clock = std::chrono::steady_clock;

    explicit Debouncer(std::chrono::milliseconds interval = kDefaultDebounceInterval)
        : interval_(interval) {}

    void Schedule(Clock::time_point now) { deadline_ = now + interval_; }
    void Cancel() { deadline_.reset(); }

    [[nodiscard]] bool Poll(Clock::time_point now) {
        if (!deadline_ || now < *deadline_) {
            return false;
        }
        deadline_.reset();
        return true;
    }

    [[nodiscard]] bool Pending() const noexcept { return deadline_.has_value(); }
    [[nodiscard]] std::chrono::milliseconds Interval() const noexcept { return interval_; }
    [[nodiscard]] std::optional<Clock::time_point> Deadline() const { return deadline_; }

private:
    std::chrono::milliseconds interval_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace querygraph
