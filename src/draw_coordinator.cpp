#include "draw_coordinator.hpp"

#include <chrono>
#include <utility>

#include "fairness_error.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include "verifier.hpp"

namespace fairdraw {

DrawCoordinator::DrawCoordinator(FairnessStore& store,
                                 SeedCommitmentManager& seeds,
                                 const WinnerSelector& selector,
                                 ProofRecorder& recorder,
                                 Clock clock)
    : store_(store)
    , seeds_(seeds)
    , selector_(selector)
    , recorder_(recorder)
    , clock_(std::move(clock)) {}

FairnessProof DrawCoordinator::run_draw(const std::string& giveaway_id,
                                        Timestamp entries_close_at,
                                        const std::vector<Entry>& entries) {
    auto& metrics = MetricsRegistry::instance();
    auto started = std::chrono::steady_clock::now();

    if (store_.get_proof(giveaway_id)) {
        metrics.increment_counter("sequencing_errors_total");
        throw FairnessError(ErrorCode::PROOF_ALREADY_EXISTS, giveaway_id);
    }

    auto commitment = store_.get_commitment(giveaway_id);
    if (!commitment) {
        metrics.increment_counter("sequencing_errors_total");
        throw FairnessError(ErrorCode::NOT_COMMITTED, giveaway_id);
    }

    // Refuse a malformed entry set before the seed is revealed.
    try {
        WinnerSelector::validate_entries(entries);
    } catch (const FairnessError& e) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::INTEGRITY_FAILURE,
                            "internal", "Draw halted for giveaway " + giveaway_id + ": " + e.what());
        metrics.increment_counter("integrity_failures_total");
        throw;
    }

    Bytes seed;
    if (commitment->revealed) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE,
                            "internal", "Resuming draw from revealed seed for giveaway " + giveaway_id);
        seed = seeds_.revealed_seed(giveaway_id);
    } else {
        seed = seeds_.reveal(giveaway_id, entries_close_at);
    }

    SelectionOutcome outcome = selector_.select_winner(seed, entries);
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::WINNER_SELECTED,
                        "internal", "giveaway=" + giveaway_id + " winner_entry=" + outcome.winner.entry_id);

    FairnessProof proof = recorder_.record(giveaway_id, commitment->commitment, seed, outcome, entries.size());

    auto self_check = Verifier::verify(proof, entries);
    if (!self_check.valid) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::INTEGRITY_FAILURE,
                            "internal", "Recorded proof failed strong verification for giveaway " + giveaway_id);
        metrics.increment_counter("integrity_failures_total");
    }

    metrics.increment_counter("draws_total");
    metrics.observe_duration("draw", std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
    return proof;
}

LifecycleState DrawCoordinator::lifecycle_state(const std::string& giveaway_id) {
    auto commitment = store_.get_commitment(giveaway_id);
    if (!commitment) return LifecycleState::UNCOMMITTED;
    if (store_.get_proof(giveaway_id)) return LifecycleState::PROVEN;
    if (commitment->revealed) return LifecycleState::REVEALED;
    if (clock_() >= commitment->entries_close_at) return LifecycleState::CLOSED;
    return LifecycleState::COMMITTED;
}

}
