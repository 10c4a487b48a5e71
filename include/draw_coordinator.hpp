#pragma once

#include <string>
#include <vector>

#include "fairness_store.hpp"
#include "fairness_types.hpp"
#include "proof_recorder.hpp"
#include "seed_commitment_manager.hpp"
#include "winner_selector.hpp"

namespace fairdraw {

// Runs reveal -> select -> record for one giveaway as a single unit.
// A selection whose proof could not be written is discarded; calling
// run_draw again resumes from the already revealed seed and recomputes it.
class DrawCoordinator {
public:
    DrawCoordinator(FairnessStore& store,
                    SeedCommitmentManager& seeds,
                    const WinnerSelector& selector,
                    ProofRecorder& recorder,
                    Clock clock = system_now);

    /**
     * Draws the winner for a closed giveaway.
     * @param entries_close_at Close time supplied by the giveaway collaborator.
     * @param entries Frozen list of paid entries.
     * @throws FairnessError on any sequencing, integrity or storage failure.
     */
    FairnessProof run_draw(const std::string& giveaway_id,
                           Timestamp entries_close_at,
                           const std::vector<Entry>& entries);

    // Current position in the fairness lifecycle, derived from storage.
    LifecycleState lifecycle_state(const std::string& giveaway_id);

private:
    FairnessStore& store_;
    SeedCommitmentManager& seeds_;
    const WinnerSelector& selector_;
    ProofRecorder& recorder_;
    Clock clock_;
};

}
