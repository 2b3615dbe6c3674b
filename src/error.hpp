#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace txproof {

// Failure classes raised while building or serving inclusion proofs.
// The orchestrator decides fallback purely from this enum, never from
// the message text.
enum class ErrorKind {
    TransactionNotInBlock,
    MerkleRootMismatch,
    MalformedTransaction,
    UnsupportedTransactionFormat,
    WitnessCommitmentNotFound,
    WitnessCommitmentMismatch,
    ProofLengthMismatch,
    RateLimited,
    JobNotFound,
    NodeError,
    InvalidArgument,
    Internal
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransactionNotInBlock:        return "TransactionNotInBlock";
        case ErrorKind::MerkleRootMismatch:           return "MerkleRootMismatch";
        case ErrorKind::MalformedTransaction:         return "MalformedTransaction";
        case ErrorKind::UnsupportedTransactionFormat: return "UnsupportedTransactionFormat";
        case ErrorKind::WitnessCommitmentNotFound:    return "WitnessCommitmentNotFound";
        case ErrorKind::WitnessCommitmentMismatch:    return "WitnessCommitmentMismatch";
        case ErrorKind::ProofLengthMismatch:          return "ProofLengthMismatch";
        case ErrorKind::RateLimited:                  return "RateLimited";
        case ErrorKind::JobNotFound:                  return "JobNotFound";
        case ErrorKind::NodeError:                    return "NodeError";
        case ErrorKind::InvalidArgument:              return "InvalidArgument";
        case ErrorKind::Internal:                     return "Internal";
    }
    return "Unknown";
}

class ProofError : public std::runtime_error {
public:
    ProofError(ErrorKind kind, const std::string& message = "")
        : std::runtime_error(message.empty() ? to_string(kind) : message)
        , kind_(kind)
    {}

    // RateLimited errors carry how long the caller should wait
    ProofError(ErrorKind kind, const std::string& message, std::chrono::seconds retry_after)
        : std::runtime_error(message)
        , kind_(kind)
        , retry_after_(retry_after)
    {}

    ErrorKind kind() const { return kind_; }

    std::optional<std::chrono::seconds> retry_after() const { return retry_after_; }

private:
    ErrorKind kind_;
    std::optional<std::chrono::seconds> retry_after_;
};

} // namespace txproof
