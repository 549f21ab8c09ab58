#pragma once

#include "core/types.hh"
#include <optional>

namespace aether {

// ============================================================================
// RPC Records
// ============================================================================

// getAccount
struct AccountInfo {
    Address address;
    amount_t balance = 0;
    nonce_t nonce = 0;
    std::optional<hash_t> code_hash;   // Set for contract accounts

    bool operator==(const AccountInfo&) const = default;
};

// ai_getProviderReputation
struct ProviderReputation {
    Address provider;
    double score = 0.0;
    std::uint64_t completed_jobs = 0;
    double average_time = 0.0;         // Seconds per job

    bool operator==(const ProviderReputation&) const = default;
};

}  // namespace aether
