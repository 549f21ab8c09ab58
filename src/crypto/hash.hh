#pragma once

#include "core/types.hh"
#include <span>
#include <string_view>

namespace aether {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

// One-shot digests
[[nodiscard]] hash_t sha256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha256(const void* data, std::size_t len);
[[nodiscard]] hash_t sha256(std::string_view text);

}  // namespace aether
