#pragma once

#include "clock.hh"
#include "core/config.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "core/types.hh"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace aether {

// ============================================================================
// Classification
// ============================================================================

enum class Progress : std::uint8_t {
    PENDING = 0,
    SUCCESS = 1,
    FAILURE = 2,
};

[[nodiscard]] constexpr std::string_view progress_string(Progress progress) {
    switch (progress) {
        case Progress::PENDING: return "pending";
        case Progress::SUCCESS: return "success";
        case Progress::FAILURE: return "failure";
    }
    return "unknown";
}

struct Classification {
    Progress progress = Progress::PENDING;
    std::string reason;  // Set for FAILURE

    [[nodiscard]] static Classification pending() { return {Progress::PENDING, {}}; }
    [[nodiscard]] static Classification success() { return {Progress::SUCCESS, {}}; }
    [[nodiscard]] static Classification failure(std::string reason) {
        return {Progress::FAILURE, std::move(reason)};
    }

    bool operator==(const Classification&) const = default;
};

// ============================================================================
// Wait Options
// ============================================================================

// What an absent probe result means
enum class MissingPolicy : std::uint8_t {
    KEEP_WAITING = 0,    // Not created yet (receipt before inclusion)
    FAIL_NOT_FOUND = 1,  // Should already exist (job id)
};

struct WaitOptions {
    millis_t timeout{30'000};
    millis_t poll_interval{1'000};
    MissingPolicy missing = MissingPolicy::KEEP_WAITING;

    [[nodiscard]] static WaitOptions for_transactions(const ClientConfig& config);
    [[nodiscard]] static WaitOptions for_jobs(const ClientConfig& config);

    // Throws ValidationError for a negative timeout or non-positive interval
    void validate() const;
};

// ============================================================================
// Completion Tracker
// ============================================================================

// Bounded polling loop:
//
//   Waiting --probe/classify--> Waiting            (pending, sleep one interval)
//           --probe/classify--> return artifact    (success)
//           --probe/classify--> throw RemoteFailure
//           --deadline-------> throw Timeout
//
// The deadline is checked before every probe and again after it returns but
// before its result is examined, so a late success never beats an expired
// deadline. A sleep never overshoots the deadline. Each tracker owns its loop
// and deadline; run independent waits on independent trackers.
template<typename T>
class CompletionTracker {
public:
    using Probe = std::function<std::optional<T>()>;
    using Classifier = std::function<Classification(const T&)>;

    CompletionTracker(std::string subject,
                      Probe probe,
                      Classifier classify,
                      WaitOptions options,
                      Clock& clock = SystemClock::instance(),
                      const ComponentLogger& logger = log::tracker)
        : subject_(std::move(subject))
        , probe_(std::move(probe))
        , classify_(std::move(classify))
        , options_(options)
        , clock_(clock)
        , logger_(logger) {
        options_.validate();
    }

    CompletionTracker(const CompletionTracker&) = delete;
    CompletionTracker& operator=(const CompletionTracker&) = delete;

    // Returns the artifact from the probe that classified as success.
    // Throws Timeout, RemoteFailure or NotFound; probe exceptions propagate.
    [[nodiscard]] T wait() {
        const steady_time_t start = clock_.now();
        const steady_time_t deadline = start + options_.timeout;
        probes_ = 0;

        AETHER_LOG_DEBUG(logger_) << "Waiting for " << subject_
                                  << " (timeout=" << options_.timeout.count()
                                  << "ms, poll=" << options_.poll_interval.count() << "ms)";

        for (;;) {
            if (clock_.now() >= deadline) {
                throw timed_out();
            }

            ++probes_;
            std::optional<T> state = probe_();

            if (clock_.now() >= deadline) {
                throw timed_out();
            }

            Classification verdict = Classification::pending();
            if (!state) {
                if (options_.missing == MissingPolicy::FAIL_NOT_FOUND) {
                    AETHER_LOG_DEBUG(logger_) << subject_ << " not found on probe " << probes_;
                    throw NotFound(subject_);
                }
            } else {
                verdict = classify_(*state);
            }

            switch (verdict.progress) {
                case Progress::SUCCESS:
                    AETHER_LOG_DEBUG(logger_) << subject_ << " completed after " << probes_
                                              << " probe(s), " << elapsed_ms(start) << "ms";
                    return std::move(*state);

                case Progress::FAILURE:
                    logger_.warn() << subject_ << " failed: " << verdict.reason;
                    throw RemoteFailure(subject_, verdict.reason);

                case Progress::PENDING:
                    break;
            }

            AETHER_LOG_TRACE(logger_) << subject_ << " still pending after probe " << probes_;

            // Rounded up so a sub-millisecond remainder still sleeps past the deadline
            auto remaining = std::chrono::ceil<millis_t>(deadline - clock_.now());
            if (remaining <= millis_t::zero()) {
                throw timed_out();
            }
            clock_.sleep_for(std::min(options_.poll_interval, remaining));
        }
    }

    [[nodiscard]] std::size_t probes() const { return probes_; }
    [[nodiscard]] const std::string& subject() const { return subject_; }
    [[nodiscard]] const WaitOptions& options() const { return options_; }

private:
    [[nodiscard]] Timeout timed_out() const {
        logger_.warn() << "Gave up on " << subject_ << " after " << probes_
                       << " probe(s), budget " << options_.timeout.count() << "ms";
        return Timeout(subject_, options_.timeout, probes_);
    }

    [[nodiscard]] long long elapsed_ms(steady_time_t start) const {
        return std::chrono::duration_cast<millis_t>(clock_.now() - start).count();
    }

    std::string subject_;
    Probe probe_;
    Classifier classify_;
    WaitOptions options_;
    Clock& clock_;
    const ComponentLogger& logger_;
    std::size_t probes_ = 0;
};

}  // namespace aether
