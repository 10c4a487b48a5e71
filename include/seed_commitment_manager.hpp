#pragma once

#include <functional>
#include <optional>
#include <string>

#include "fairness_store.hpp"
#include "fairness_types.hpp"
#include "random_source.hpp"

namespace fairdraw {

using Clock = std::function<Timestamp()>;

Timestamp system_now();

// Owns the commit and reveal halves of the protocol for every giveaway.
// The seed never leaves this class before the giveaway's reveal succeeded.
class SeedCommitmentManager {
public:
    SeedCommitmentManager(FairnessStore& store, RandomSource& random, Clock clock = system_now);

    /**
     * Generates and persists a fresh seed commitment.
     * Must be called strictly before the entry window closes.
     * @return The stored record with the seed redacted, for public display.
     * @throws FairnessError ENTRIES_CLOSED, ALREADY_COMMITTED, STORAGE_UNAVAILABLE, ENTROPY_FAILURE
     */
    SeedCommitment commit(const std::string& giveaway_id,
                          Timestamp entries_close_at,
                          const std::string& creator_id = "");

    /**
     * Reveals the seed once the entry window has closed.
     * @param entries_close_at Close time supplied by the giveaway collaborator. The close
     *        time recorded at commit still applies when this one is earlier.
     * @throws FairnessError NOT_COMMITTED, PREMATURE_REVEAL, ALREADY_REVEALED, STORAGE_UNAVAILABLE
     */
    Bytes reveal(const std::string& giveaway_id, Timestamp entries_close_at);

    // Seed of a commitment that has already been revealed (NOT_REVEALED otherwise).
    Bytes revealed_seed(const std::string& giveaway_id);

    // Published view: seed included only after reveal.
    std::optional<SeedCommitment> public_commitment(const std::string& giveaway_id);

private:
    FairnessStore& store_;
    RandomSource& random_;
    Clock clock_;
};

}
