#pragma once

#include "core/types.hh"
#include <cstddef>
#include <mutex>

namespace aether {

// ============================================================================
// Clock Abstraction
// ============================================================================

// Source of time and the only place a wait is allowed to block.
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual steady_time_t now() const = 0;
    virtual void sleep_for(millis_t duration) = 0;
};

// Monotonic wall time, real sleeps
class SystemClock final : public Clock {
public:
    [[nodiscard]] steady_time_t now() const override;
    void sleep_for(millis_t duration) override;

    // Shared process-wide instance
    [[nodiscard]] static SystemClock& instance();
};

// ============================================================================
// Manual Clock
// ============================================================================

// Virtual time. sleep_for() returns immediately after advancing the clock, so
// a wait that would take minutes completes in microseconds and every probe
// happens at an exact, predictable instant. Safe to share between threads.
class ManualClock final : public Clock {
public:
    ManualClock();

    [[nodiscard]] steady_time_t now() const override;
    void sleep_for(millis_t duration) override;

    void advance(millis_t duration);

    // Time since construction
    [[nodiscard]] millis_t elapsed() const;
    [[nodiscard]] std::size_t sleep_count() const;
    [[nodiscard]] millis_t total_slept() const;

private:
    mutable std::mutex mutex_;
    steady_time_t origin_;
    steady_time_t now_;
    std::size_t sleeps_ = 0;
    millis_t slept_{0};
};

}  // namespace aether
