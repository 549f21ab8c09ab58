#include "types.hh"
#include <algorithm>
#include <atomic>

namespace aether {

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

namespace {

[[nodiscard]] int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

std::string to_prefixed_hex(std::span<const std::uint8_t> bytes) {
    return "0x" + bytes_to_hex(bytes);
}

std::optional<bytes_t> hex_to_bytes(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    bytes_t result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }

    return result;
}

// ============================================================================
// UTF-8 Validation
// ============================================================================

bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<std::uint8_t>(text[i]);
        std::size_t extra = 0;
        std::uint32_t cp = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false;
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<std::uint8_t>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and out-of-range code points
        if ((extra == 1 && cp < 0x80) ||
            (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }
    return true;
}

// ============================================================================
// Secure Zero
// ============================================================================

void secure_zero(void* ptr, std::size_t len) {
    volatile std::uint8_t* p = static_cast<volatile std::uint8_t*>(ptr);
    while (len--) {
        *p++ = 0;
    }
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

// ============================================================================
// Address Implementation
// ============================================================================

std::string Address::to_hex() const {
    return to_prefixed_hex(bytes);
}

std::optional<Address> Address::from_hex(std::string_view hex) {
    auto raw = fixed_from_prefixed_hex<ADDRESS_SIZE>(hex);
    if (!raw) {
        return std::nullopt;
    }
    Address addr;
    addr.bytes = *raw;
    return addr;
}

}  // namespace aether
