#include "error.hh"
#include <utility>

namespace aether {

IncompleteTransaction::IncompleteTransaction(std::string field)
    : ValidationError("incomplete transaction: missing required field '" + field + "'")
    , field_(std::move(field)) {}

RemoteFailure::RemoteFailure(std::string subject, std::string reason)
    : Error(ErrorKind::REMOTE_FAILURE, subject + " failed: " + reason)
    , subject_(std::move(subject))
    , reason_(std::move(reason)) {}

Timeout::Timeout(std::string subject, std::chrono::milliseconds budget, std::size_t probes)
    : Error(ErrorKind::TIMEOUT,
            subject + " did not complete within " + std::to_string(budget.count()) +
            "ms (" + std::to_string(probes) + " probes)")
    , subject_(std::move(subject))
    , budget_(budget)
    , probes_(probes) {}

NotFound::NotFound(std::string subject)
    : Error(ErrorKind::NOT_FOUND, subject + " not found")
    , subject_(std::move(subject)) {}

RpcError::RpcError(std::string method, std::int64_t code, const std::string& message)
    : Error(ErrorKind::RPC,
            "rpc " + method + " failed: " + message +
            (code == TRANSPORT_ERROR ? std::string{} : " (code: " + std::to_string(code) + ")"))
    , method_(std::move(method))
    , code_(code) {}

}  // namespace aether
