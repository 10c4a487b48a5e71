#include "verifier.hpp"

#include "crypto.hpp"
#include "fairness_error.hpp"
#include "winner_selector.hpp"

namespace fairdraw {

namespace {

void add_reason(VerificationResult& result, FailureReason reason) {
    if (!result.has_reason(reason)) {
        result.reasons.push_back(reason);
    }
}

// Cross-checks disclosed per-entry records against the seed and the claimed winner.
void check_records(const FairnessProof& proof, const Bytes& seed, const Digest& winner_digest,
                   VerificationResult& result) {
    if (proof.records.size() != proof.total_entries) {
        add_reason(result, FailureReason::ENTRY_COUNT_MISMATCH);
    }

    bool winner_listed = false;
    for (const auto& rec : proof.records) {
        auto claimed = crypto::digest_from_hex(rec.keyed_value);
        Digest actual = crypto::hmac_sha256(seed, rec.deterministic_input);
        if (!claimed || *claimed != actual) {
            add_reason(result, FailureReason::RECORD_MISMATCH);
            continue;
        }

        if (rec.entry_id == proof.winner_entry_id) {
            winner_listed = true;
            if (rec.deterministic_input != proof.winner_deterministic_input) {
                add_reason(result, FailureReason::RECORD_MISMATCH);
            }
        } else if (WinnerSelector::outranks(actual, rec.deterministic_input,
                                            winner_digest, proof.winner_deterministic_input)) {
            add_reason(result, FailureReason::NOT_MAXIMAL);
        }
    }

    if (!winner_listed) {
        add_reason(result, FailureReason::RECORD_MISMATCH);
    }
}

}

VerificationResult Verifier::verify(const FairnessProof& proof) {
    VerificationResult result;
    result.mode = VerificationMode::WEAK;
    result.maximality_checked = false;

    if (proof.selection_rule != SELECTION_RULE) {
        add_reason(result, FailureReason::UNKNOWN_SELECTION_RULE);
    }

    auto seed = crypto::from_hex(proof.seed);
    auto commitment = crypto::digest_from_hex(proof.commitment);
    auto keyed_value = crypto::digest_from_hex(proof.winner_keyed_value);

    // Seeds are exactly SEED_BYTES wide.
    if (!seed || seed->size() != SEED_BYTES) {
        add_reason(result, FailureReason::MALFORMED_PROOF);
        result.valid = false;
        return result;
    }

    Digest computed_commitment = crypto::sha256(*seed);
    Digest computed_keyed = crypto::hmac_sha256(*seed, proof.winner_deterministic_input);
    result.computed_commitment = crypto::to_hex(computed_commitment);
    result.computed_keyed_value = crypto::to_hex(computed_keyed);

    if (!commitment) {
        add_reason(result, FailureReason::MALFORMED_PROOF);
    } else if (*commitment != computed_commitment) {
        add_reason(result, FailureReason::COMMITMENT_MISMATCH);
    }

    if (!keyed_value) {
        add_reason(result, FailureReason::MALFORMED_PROOF);
    } else if (*keyed_value != computed_keyed) {
        add_reason(result, FailureReason::KEYED_VALUE_MISMATCH);
    }

    if (!proof.records.empty()) {
        check_records(proof, *seed, computed_keyed, result);
        // Disclosed records covering every entry rank the whole field.
        result.maximality_checked = proof.records.size() == proof.total_entries &&
                                    !result.has_reason(FailureReason::RECORD_MISMATCH);
    }

    result.valid = result.reasons.empty();
    return result;
}

VerificationResult Verifier::verify(const FairnessProof& proof, const std::vector<Entry>& entries) {
    VerificationResult result = verify(proof);
    result.mode = VerificationMode::STRONG;
    // In strong mode the flag reports the re-run over the supplied list.
    result.maximality_checked = false;

    if (entries.size() != proof.total_entries) {
        add_reason(result, FailureReason::ENTRY_COUNT_MISMATCH);
    }

    auto seed = crypto::from_hex(proof.seed);
    if (!seed || seed->size() != SEED_BYTES) {
        result.valid = false;
        return result;
    }

    try {
        SelectionOutcome outcome = WinnerSelector().select_winner(*seed, entries);
        result.maximality_checked = true;
        result.expected_winner_entry_id = outcome.winner.entry_id;

        if (outcome.winner.entry_id != proof.winner_entry_id) {
            add_reason(result, FailureReason::NOT_MAXIMAL);
        } else if (outcome.winner.deterministic_input != proof.winner_deterministic_input ||
                   outcome.winner.user_id != proof.winner_user_id) {
            add_reason(result, FailureReason::RECORD_MISMATCH);
        }
    } catch (const FairnessError&) {
        add_reason(result, FailureReason::INVALID_ENTRY_LIST);
    }

    result.valid = result.reasons.empty();
    return result;
}

}
