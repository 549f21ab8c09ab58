#include "codec.hh"
#include "crypto/hash.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <algorithm>
#include <limits>

namespace aether {

namespace {

void put_u64(bytes_t& out, std::uint64_t value) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), value);
    out.insert(out.end(), buf.begin(), buf.end());
}

void put_var(bytes_t& out, std::span<const std::uint8_t> data, std::string_view field,
             std::size_t limit) {
    if (data.size() > limit || data.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw ValidationError(std::string(field) + " exceeds " + std::to_string(limit) + " bytes");
    }
    std::array<std::uint8_t, 4> len;
    encode_u32(len.data(), static_cast<std::uint32_t>(data.size()));
    out.insert(out.end(), len.begin(), len.end());
    out.insert(out.end(), data.begin(), data.end());
}

// Bounds-checked reader over encoded bytes
class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data) : data_(data) {}

    template<std::size_t N>
    bool take(std::array<std::uint8_t, N>& out) {
        if (remaining() < N) return false;
        std::copy_n(data_.begin() + pos_, N, out.begin());
        pos_ += N;
        return true;
    }

    bool u64(std::uint64_t& out) {
        if (remaining() < 8) return false;
        out = decode_u64(data_.data() + pos_);
        pos_ += 8;
        return true;
    }

    std::optional<std::span<const std::uint8_t>> var(std::size_t limit) {
        if (remaining() < 4) return std::nullopt;
        std::uint32_t len = decode_u32(data_.data() + pos_);
        pos_ += 4;
        if (len > limit || remaining() < len) return std::nullopt;
        auto out = data_.subspan(pos_, len);
        pos_ += len;
        return out;
    }

    [[nodiscard]] std::size_t remaining() const { return data_.size() - pos_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

}  // namespace

bytes_t canonical_encode(const TransactionFields& fields) {
    std::span<const std::uint8_t> memo;
    if (fields.memo) {
        if (!is_valid_utf8(*fields.memo)) {
            throw ValidationError("memo is not valid UTF-8");
        }
        memo = {reinterpret_cast<const std::uint8_t*>(fields.memo->data()), fields.memo->size()};
    }

    std::span<const std::uint8_t> payload;
    if (fields.payload) {
        payload = *fields.payload;
    }

    bytes_t out;
    out.reserve(CANONICAL_FIXED_SIZE + memo.size() + payload.size());

    out.insert(out.end(), fields.sender.begin(), fields.sender.end());
    out.insert(out.end(), fields.sender_public_key.begin(), fields.sender_public_key.end());
    out.insert(out.end(), fields.recipient.begin(), fields.recipient.end());

    put_u64(out, fields.amount);
    put_u64(out, fields.fee);
    put_u64(out, fields.gas_limit);
    put_u64(out, fields.nonce);

    put_var(out, memo, "memo", MAX_MEMO_SIZE);
    put_var(out, payload, "payload", MAX_PAYLOAD_SIZE);

    AETHER_LOG_TRACE(log::codec) << "Encoded transaction nonce=" << fields.nonce
                                 << " into " << out.size() << " bytes";
    return out;
}

std::optional<TransactionFields> canonical_decode(std::span<const std::uint8_t> encoded) {
    Reader reader(encoded);
    TransactionFields fields;

    if (!reader.take(fields.sender.bytes) ||
        !reader.take(fields.sender_public_key) ||
        !reader.take(fields.recipient.bytes) ||
        !reader.u64(fields.amount) ||
        !reader.u64(fields.fee) ||
        !reader.u64(fields.gas_limit) ||
        !reader.u64(fields.nonce)) {
        return std::nullopt;
    }

    auto memo = reader.var(MAX_MEMO_SIZE);
    if (!memo) return std::nullopt;
    auto payload = reader.var(MAX_PAYLOAD_SIZE);
    if (!payload) return std::nullopt;

    if (reader.remaining() != 0) {
        AETHER_LOG_DEBUG(log::codec) << "Rejected encoding with " << reader.remaining()
                                     << " trailing bytes";
        return std::nullopt;
    }

    if (!memo->empty()) {
        std::string text(memo->begin(), memo->end());
        if (!is_valid_utf8(text)) return std::nullopt;
        fields.memo = std::move(text);
    }
    if (!payload->empty()) {
        fields.payload = bytes_t(payload->begin(), payload->end());
    }
    return fields;
}

hash_t canonical_digest(std::span<const std::uint8_t> encoded) {
    return sha256(encoded);
}

hash_t transaction_hash(const TransactionFields& fields) {
    return canonical_digest(canonical_encode(fields));
}

}  // namespace aether
