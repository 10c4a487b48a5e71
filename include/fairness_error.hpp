#pragma once

#include <stdexcept>
#include <string>

namespace fairdraw {

enum class ErrorCode {
    // Protocol sequencing
    ALREADY_COMMITTED,
    ENTRIES_CLOSED,
    NOT_COMMITTED,
    PREMATURE_REVEAL,
    ALREADY_REVEALED,
    NOT_REVEALED,
    PROOF_ALREADY_EXISTS,

    // Data integrity
    SEED_COMMITMENT_MISMATCH,
    DUPLICATE_ENTRY_INPUT,
    NO_ELIGIBLE_ENTRIES,
    EMPTY_ENTRY_INPUT,
    ENTRY_COUNT_MISMATCH,

    // Infrastructure
    STORAGE_UNAVAILABLE,
    ENTROPY_FAILURE
};

enum class ErrorCategory {
    SEQUENCING,
    INTEGRITY,
    INFRASTRUCTURE
};

inline ErrorCategory category_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::ALREADY_COMMITTED:
        case ErrorCode::ENTRIES_CLOSED:
        case ErrorCode::NOT_COMMITTED:
        case ErrorCode::PREMATURE_REVEAL:
        case ErrorCode::ALREADY_REVEALED:
        case ErrorCode::NOT_REVEALED:
        case ErrorCode::PROOF_ALREADY_EXISTS:
            return ErrorCategory::SEQUENCING;
        case ErrorCode::SEED_COMMITMENT_MISMATCH:
        case ErrorCode::DUPLICATE_ENTRY_INPUT:
        case ErrorCode::NO_ELIGIBLE_ENTRIES:
        case ErrorCode::EMPTY_ENTRY_INPUT:
        case ErrorCode::ENTRY_COUNT_MISMATCH:
            return ErrorCategory::INTEGRITY;
        default:
            return ErrorCategory::INFRASTRUCTURE;
    }
}

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ALREADY_COMMITTED: return "AlreadyCommitted";
        case ErrorCode::ENTRIES_CLOSED: return "EntriesClosed";
        case ErrorCode::NOT_COMMITTED: return "NotCommitted";
        case ErrorCode::PREMATURE_REVEAL: return "PrematureReveal";
        case ErrorCode::ALREADY_REVEALED: return "AlreadyRevealed";
        case ErrorCode::NOT_REVEALED: return "NotRevealed";
        case ErrorCode::PROOF_ALREADY_EXISTS: return "ProofAlreadyExists";
        case ErrorCode::SEED_COMMITMENT_MISMATCH: return "SeedCommitmentMismatch";
        case ErrorCode::DUPLICATE_ENTRY_INPUT: return "DuplicateEntryInput";
        case ErrorCode::NO_ELIGIBLE_ENTRIES: return "NoEligibleEntries";
        case ErrorCode::EMPTY_ENTRY_INPUT: return "EmptyEntryInput";
        case ErrorCode::ENTRY_COUNT_MISMATCH: return "EntryCountMismatch";
        case ErrorCode::STORAGE_UNAVAILABLE: return "StorageUnavailable";
        case ErrorCode::ENTROPY_FAILURE: return "EntropyFailure";
        default: return "Unknown";
    }
}

// Raised for protocol-sequencing, data-integrity and infrastructure failures.
// Verification outcomes are never reported through this type.
class FairnessError : public std::runtime_error {
public:
    FairnessError(ErrorCode code, const std::string& detail)
        : std::runtime_error(std::string(error_code_name(code)) + ": " + detail)
        , code_(code) {}

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return category_of(code_); }

private:
    ErrorCode code_;
};

}
