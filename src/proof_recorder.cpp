#include "proof_recorder.hpp"

#include <utility>

#include "crypto.hpp"
#include "fairness_error.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace fairdraw {

ProofRecorder::ProofRecorder(FairnessStore& store,
                             GiveawayFinalizer* finalizer,
                             DisclosureMode disclosure,
                             Clock clock)
    : store_(store)
    , finalizer_(finalizer)
    , disclosure_(disclosure)
    , clock_(std::move(clock)) {}

FairnessProof ProofRecorder::record(const std::string& giveaway_id,
                                    const std::string& commitment,
                                    const Bytes& seed,
                                    const SelectionOutcome& outcome,
                                    uint64_t total_entries) {
    auto& metrics = MetricsRegistry::instance();

    if (seed.size() != SEED_BYTES) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::INTEGRITY_FAILURE,
                            "internal", "Seed for giveaway " + giveaway_id + " is " + std::to_string(seed.size()) +
                            " bytes; draw halted");
        metrics.increment_counter("integrity_failures_total");
        throw FairnessError(ErrorCode::SEED_COMMITMENT_MISMATCH, "seed for " + giveaway_id + " has the wrong width");
    }

    auto expected = crypto::digest_from_hex(commitment);
    if (!expected || crypto::sha256(seed) != *expected) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::INTEGRITY_FAILURE,
                            "internal", "Seed does not match published commitment for giveaway " + giveaway_id +
                            "; draw halted");
        metrics.increment_counter("integrity_failures_total");
        throw FairnessError(ErrorCode::SEED_COMMITMENT_MISMATCH, giveaway_id);
    }

    if (outcome.all_keyed_values.size() != total_entries) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::INTEGRITY_FAILURE,
                            "internal", "Selection covered " + std::to_string(outcome.all_keyed_values.size()) +
                            " entries, expected " + std::to_string(total_entries) + " for giveaway " + giveaway_id);
        metrics.increment_counter("integrity_failures_total");
        throw FairnessError(ErrorCode::ENTRY_COUNT_MISMATCH, giveaway_id);
    }

    const SelectionRecord* winner_record = nullptr;
    for (const auto& rec : outcome.all_keyed_values) {
        if (rec.entry_id == outcome.winner.entry_id) {
            winner_record = &rec;
            break;
        }
    }
    if (winner_record == nullptr) {
        metrics.increment_counter("integrity_failures_total");
        throw FairnessError(ErrorCode::ENTRY_COUNT_MISMATCH,
                            "winner " + outcome.winner.entry_id + " missing from selection records");
    }

    FairnessProof proof;
    proof.giveaway_id = giveaway_id;
    proof.winner_entry_id = outcome.winner.entry_id;
    proof.winner_user_id = outcome.winner.user_id;
    proof.seed = crypto::to_hex(seed);
    proof.commitment = crypto::to_hex(*expected);
    proof.total_entries = total_entries;
    proof.winner_deterministic_input = winner_record->deterministic_input;
    proof.winner_keyed_value = winner_record->keyed_value;
    proof.selection_rule = SELECTION_RULE;
    proof.verified_at = clock_();
    if (disclosure_ == DisclosureMode::FULL) {
        proof.records = outcome.all_keyed_values;
    }

    switch (store_.create_proof(proof)) {
        case WriteStatus::OK:
            break;
        case WriteStatus::EXISTS:
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SEQUENCE_VIOLATION,
                                "internal", "Second proof rejected for giveaway " + giveaway_id);
            metrics.increment_counter("sequencing_errors_total");
            throw FairnessError(ErrorCode::PROOF_ALREADY_EXISTS, giveaway_id);
        default:
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                                "internal", "Proof write failed for giveaway " + giveaway_id);
            throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, "proof write failed for " + giveaway_id);
    }

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::PROOF_RECORDED,
                        "internal", "giveaway=" + giveaway_id + " winner_entry=" + proof.winner_entry_id +
                        " entries=" + std::to_string(total_entries));
    metrics.increment_counter("proofs_total");

    // The proof is final at this point; a failed notification is retried by
    // the giveaway collaborator, not by re-recording.
    if (finalizer_ != nullptr &&
        !finalizer_->mark_winner(giveaway_id, proof.winner_entry_id, proof.winner_user_id)) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            "internal", "Giveaway finalization failed for " + giveaway_id);
        metrics.increment_counter("finalization_failures_total");
    }

    return proof;
}

std::optional<FairnessProof> ProofRecorder::proof(const std::string& giveaway_id) {
    return store_.get_proof(giveaway_id);
}

}
