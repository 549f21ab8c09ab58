#include "completion_tracker.hh"

namespace aether {

WaitOptions WaitOptions::for_transactions(const ClientConfig& config) {
    WaitOptions options;
    options.timeout = config.tx_timeout;
    options.poll_interval = config.tx_poll_interval;
    options.missing = MissingPolicy::KEEP_WAITING;
    return options;
}

WaitOptions WaitOptions::for_jobs(const ClientConfig& config) {
    WaitOptions options;
    options.timeout = config.job_timeout;
    options.poll_interval = config.job_poll_interval;
    options.missing = config.job_missing_is_error ? MissingPolicy::FAIL_NOT_FOUND
                                                  : MissingPolicy::KEEP_WAITING;
    return options;
}

void WaitOptions::validate() const {
    if (timeout.count() < 0) {
        throw ValidationError("wait timeout must not be negative");
    }
    if (poll_interval.count() <= 0) {
        throw ValidationError("poll interval must be positive");
    }
}

}  // namespace aether
