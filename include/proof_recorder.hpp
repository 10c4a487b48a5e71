#pragma once

#include <optional>
#include <string>

#include "fairness_store.hpp"
#include "fairness_types.hpp"
#include "giveaway_finalizer.hpp"
#include "seed_commitment_manager.hpp"
#include "server_config.hpp"

namespace fairdraw {

// Packages a finished selection into the giveaway's single immutable
// FairnessProof and appends it to the store.
class ProofRecorder {
public:
    ProofRecorder(FairnessStore& store,
                  GiveawayFinalizer* finalizer,
                  DisclosureMode disclosure = DisclosureMode::FULL,
                  Clock clock = system_now);

    /**
     * Builds, re-checks and persists the proof.
     * @throws FairnessError SEED_COMMITMENT_MISMATCH, ENTRY_COUNT_MISMATCH,
     *         PROOF_ALREADY_EXISTS, STORAGE_UNAVAILABLE
     */
    FairnessProof record(const std::string& giveaway_id,
                         const std::string& commitment,
                         const Bytes& seed,
                         const SelectionOutcome& outcome,
                         uint64_t total_entries);

    std::optional<FairnessProof> proof(const std::string& giveaway_id);

private:
    FairnessStore& store_;
    GiveawayFinalizer* finalizer_;
    DisclosureMode disclosure_;
    Clock clock_;
};

}
