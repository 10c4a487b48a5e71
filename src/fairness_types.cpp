#include "fairness_types.hpp"

namespace fairdraw {

const char* failure_reason_name(FailureReason reason) {
    switch (reason) {
        case FailureReason::MALFORMED_PROOF: return "MalformedProof";
        case FailureReason::UNKNOWN_SELECTION_RULE: return "UnknownSelectionRule";
        case FailureReason::COMMITMENT_MISMATCH: return "CommitmentMismatch";
        case FailureReason::KEYED_VALUE_MISMATCH: return "KeyedValueMismatch";
        case FailureReason::RECORD_MISMATCH: return "RecordMismatch";
        case FailureReason::ENTRY_COUNT_MISMATCH: return "EntryCountMismatch";
        case FailureReason::INVALID_ENTRY_LIST: return "InvalidEntryList";
        case FailureReason::NOT_MAXIMAL: return "NotMaximal";
        default: return "Unknown";
    }
}

const char* verification_mode_name(VerificationMode mode) {
    return mode == VerificationMode::STRONG ? "strong" : "weak";
}

const char* lifecycle_state_name(LifecycleState state) {
    switch (state) {
        case LifecycleState::UNCOMMITTED: return "uncommitted";
        case LifecycleState::COMMITTED: return "committed";
        case LifecycleState::CLOSED: return "closed";
        case LifecycleState::REVEALED: return "revealed";
        case LifecycleState::SELECTED: return "selected";
        case LifecycleState::PROVEN: return "proven";
        default: return "unknown";
    }
}

}
