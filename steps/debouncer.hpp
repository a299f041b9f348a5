#pragma once

#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace steps {

// ===================== Debouncer =====================
// Holds at most one pending value and releases it once the input has been quiet
// for `delay`. Time only moves when the caller ticks it, so there are no timers
// or threads involved and every transition is deterministic.
//
//   IDLE  --Push-->              ARMED
//   ARMED --Push-->              ARMED (value replaced, elapsed = 0)
//   ARMED --Tick-->              ARMED (elapsed += delta)
//   ARMED --Take, elapsed>=delay--> IDLE (value delivered)
//
// Not thread-safe: callers serialize access.
template <typename T>
class Debouncer {
public:
    using Duration = std::chrono::nanoseconds;

    explicit Debouncer(Duration delay) : delay_(delay) {
        if (delay < Duration::zero()) {
            throw std::invalid_argument("Debouncer delay must not be negative");
        }
    }

    // Replaces any undelivered value; only the latest value of a burst is delivered.
    void Push(T value) {
        pending_ = std::move(value);
        elapsed_ = Duration::zero();
    }

    // Negative and NaN deltas are rejected and leave the state untouched.
    // Elapsed time saturates at Duration::max() instead of wrapping.
    template <typename Rep, typename Period>
    void Tick(std::chrono::duration<Rep, Period> delta) {
        if constexpr (std::is_floating_point<Rep>::value) {
            if (std::isnan(delta.count())) {
                throw std::invalid_argument("Debouncer tick delta must not be NaN");
            }
        }
        if (delta < std::chrono::duration<Rep, Period>::zero()) {
            throw std::invalid_argument("Debouncer tick delta must not be negative");
        }

        // Anything within a second of the limit saturates, so the exact add below never overflows.
        const double seconds = std::chrono::duration<double>(delta).count();
        const double headroom = std::chrono::duration<double>(Duration::max() - elapsed_).count() - 1.0;
        if (seconds >= headroom) {
            elapsed_ = Duration::max();
            return;
        }
        if constexpr (std::is_floating_point<Rep>::value) {
            elapsed_ += std::chrono::round<Duration>(std::chrono::duration<double>(seconds));
        } else {
            elapsed_ += std::chrono::duration_cast<Duration>(delta);
        }
    }

    // Frame-clock variant, kept at nanosecond precision.
    void Tick(float deltaSeconds) {
        if (!std::isfinite(deltaSeconds) || deltaSeconds < 0.0f) {
            throw std::invalid_argument("Debouncer tick delta must be a non-negative number of seconds");
        }
        Tick(std::chrono::duration<double>(deltaSeconds));
    }

    std::optional<T> Take() {
        if (!Ready()) return std::nullopt;
        std::optional<T> out = std::move(pending_);
        pending_.reset();
        return out;
    }

    // Same threshold as Take() without consuming. Null when nothing is deliverable.
    const T* Peek() const {
        return Ready() ? &*pending_ : nullptr;
    }

    bool HasPending() const { return pending_.has_value(); }
    Duration Delay() const { return delay_; }
    Duration Elapsed() const { return elapsed_; }

private:
    bool Ready() const { return pending_.has_value() && elapsed_ >= delay_; }

    Duration delay_;
    std::optional<T> pending_;
    Duration elapsed_{Duration::zero()};
};

} // namespace steps
