#include "clock.hh"
#include <thread>

namespace aether {

// ============================================================================
// SystemClock
// ============================================================================

steady_time_t SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleep_for(millis_t duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

SystemClock& SystemClock::instance() {
    static SystemClock clock;
    return clock;
}

// ============================================================================
// ManualClock
// ============================================================================

ManualClock::ManualClock()
    : origin_(std::chrono::steady_clock::now())
    , now_(origin_) {}

steady_time_t ManualClock::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

void ManualClock::sleep_for(millis_t duration) {
    std::lock_guard lock(mutex_);
    ++sleeps_;
    if (duration.count() > 0) {
        now_ += duration;
        slept_ += duration;
    }
}

void ManualClock::advance(millis_t duration) {
    std::lock_guard lock(mutex_);
    if (duration.count() > 0) {
        now_ += duration;
    }
}

millis_t ManualClock::elapsed() const {
    std::lock_guard lock(mutex_);
    return std::chrono::duration_cast<millis_t>(now_ - origin_);
}

std::size_t ManualClock::sleep_count() const {
    std::lock_guard lock(mutex_);
    return sleeps_;
}

millis_t ManualClock::total_slept() const {
    std::lock_guard lock(mutex_);
    return slept_;
}

}  // namespace aether
