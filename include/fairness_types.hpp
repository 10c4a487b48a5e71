#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fairdraw {

using Bytes = std::vector<unsigned char>;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

inline constexpr size_t SEED_BYTES = 32;
inline constexpr const char* SELECTION_RULE = "HMAC_SHA256_MAX_LEX";

inline Timestamp from_unix_seconds(int64_t sec) {
    return Timestamp(std::chrono::seconds(sec));
}

inline int64_t to_unix_seconds(Timestamp ts) {
    return ts.time_since_epoch().count();
}

// Secret seed plus its public SHA-256 commitment for one giveaway.
struct SeedCommitment {
    std::string giveaway_id;
    std::string creator_id;
    Bytes seed;              // Empty in any copy handed out before reveal
    std::string commitment;  // Lowercase hex SHA-256 of seed
    Timestamp committed_at{};
    Timestamp entries_close_at{};
    bool revealed = false;
    std::optional<Timestamp> revealed_at;
};

// A paid entry as supplied by the entry/payment pipeline.
struct Entry {
    std::string entry_id;
    std::string deterministic_input;
    std::string user_id;
};

struct SelectionRecord {
    std::string entry_id;
    std::string deterministic_input;
    std::string keyed_value;  // Lowercase hex HMAC-SHA256(seed, deterministic_input)
    uint64_t ordinal = 0;     // Position when ordered ascending by entry_id
};

struct SelectionOutcome {
    Entry winner;
    std::vector<SelectionRecord> all_keyed_values;  // Canonical entry_id order
};

struct FairnessProof {
    std::string giveaway_id;
    std::string winner_entry_id;
    std::string winner_user_id;
    std::string seed;        // Hex
    std::string commitment;  // Hex
    uint64_t total_entries = 0;
    std::string winner_deterministic_input;
    std::string winner_keyed_value;  // Hex
    std::string selection_rule = SELECTION_RULE;
    Timestamp verified_at{};

    // Present only under full disclosure.
    std::vector<SelectionRecord> records;
};

enum class VerificationMode {
    WEAK,    // Winner's own keyed value checked against the seed
    STRONG   // Whole selection recomputed from a supplied entry list
};

enum class FailureReason {
    MALFORMED_PROOF,
    UNKNOWN_SELECTION_RULE,
    COMMITMENT_MISMATCH,
    KEYED_VALUE_MISMATCH,
    RECORD_MISMATCH,
    ENTRY_COUNT_MISMATCH,
    INVALID_ENTRY_LIST,
    NOT_MAXIMAL
};

struct VerificationResult {
    bool valid = false;
    VerificationMode mode = VerificationMode::WEAK;
    bool maximality_checked = false;
    std::vector<FailureReason> reasons;

    std::string computed_commitment;
    std::string computed_keyed_value;
    std::string expected_winner_entry_id;  // Strong mode only

    bool has_reason(FailureReason r) const {
        for (auto reason : reasons) {
            if (reason == r) return true;
        }
        return false;
    }
};

// Position of a giveaway in its fairness lifecycle. SELECTED is transient
// inside a draw and never observable from storage.
enum class LifecycleState {
    UNCOMMITTED,
    COMMITTED,
    CLOSED,
    REVEALED,
    SELECTED,
    PROVEN
};

const char* failure_reason_name(FailureReason reason);
const char* verification_mode_name(VerificationMode mode);
const char* lifecycle_state_name(LifecycleState state);

}
