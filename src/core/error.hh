#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace aether {

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind : std::uint8_t {
    VALIDATION = 0,          // Malformed or missing input, caught before any I/O
    INVALID_KEY_MATERIAL = 1,
    REMOTE_FAILURE = 2,      // Ledger reported an explicit failure state
    TIMEOUT = 3,             // We stopped waiting
    NOT_FOUND = 4,           // No remote record for the identifier
    RPC = 5,                 // Transport or JSON-RPC error object
};

[[nodiscard]] constexpr std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::INVALID_KEY_MATERIAL: return "invalid_key_material";
        case ErrorKind::REMOTE_FAILURE: return "remote_failure";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::RPC: return "rpc";
    }
    return "unknown";
}

// ============================================================================
// Exception Hierarchy
// ============================================================================

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::VALIDATION, message) {}
};

// A required transaction field was never set
class IncompleteTransaction : public ValidationError {
public:
    explicit IncompleteTransaction(std::string field);

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class InvalidKeyMaterial : public Error {
public:
    explicit InvalidKeyMaterial(const std::string& message)
        : Error(ErrorKind::INVALID_KEY_MATERIAL, message) {}
};

// The ledger reached an explicit failure state (failed receipt, challenged job)
class RemoteFailure : public Error {
public:
    RemoteFailure(std::string subject, std::string reason);

    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    std::string subject_;
    std::string reason_;
};

// The wait budget ran out; never a statement about the remote outcome
class Timeout : public Error {
public:
    Timeout(std::string subject, std::chrono::milliseconds budget, std::size_t probes);

    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }
    [[nodiscard]] std::chrono::milliseconds budget() const noexcept { return budget_; }
    [[nodiscard]] std::size_t probes() const noexcept { return probes_; }

private:
    std::string subject_;
    std::chrono::milliseconds budget_;
    std::size_t probes_;
};

class NotFound : public Error {
public:
    explicit NotFound(std::string subject);

    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }

private:
    std::string subject_;
};

class RpcError : public Error {
public:
    RpcError(std::string method, std::int64_t code, const std::string& message);

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] std::int64_t code() const noexcept { return code_; }

    // Transport-level failures carry no JSON-RPC error code
    static constexpr std::int64_t TRANSPORT_ERROR = 0;

private:
    std::string method_;
    std::int64_t code_;
};

}  // namespace aether
