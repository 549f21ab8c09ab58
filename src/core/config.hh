#pragma once

#include "types.hh"
#include <chrono>

namespace aether {

// ============================================================================
// Client Configuration
// ============================================================================

struct ClientConfig {
    // Applied by TransactionBuilder::with_defaults
    amount_t default_fee = 2'000'000;
    gas_t default_gas_limit = 500'000;

    // wait_for_transaction
    millis_t tx_timeout{30'000};
    millis_t tx_poll_interval{1'000};

    // wait_for_job_completion
    millis_t job_timeout{300'000};
    millis_t job_poll_interval{2'000};

    // A job id the node does not know about fails fast with NotFound
    // instead of being polled until the timeout.
    bool job_missing_is_error = true;
};

}  // namespace aether
