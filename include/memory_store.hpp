#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "fairness_store.hpp"
#include "giveaway_finalizer.hpp"

namespace fairdraw {

// In-process store for local development and tests. Records live only as
// long as the process.
class MemoryStore : public FairnessStore, public GiveawayFinalizer {
public:
    WriteStatus create_commitment(const SeedCommitment& record) override;
    std::optional<SeedCommitment> get_commitment(const std::string& giveaway_id) override;
    WriteStatus mark_revealed(const std::string& giveaway_id, Timestamp revealed_at) override;

    WriteStatus create_proof(const FairnessProof& proof) override;
    std::optional<FairnessProof> get_proof(const std::string& giveaway_id) override;

    bool mark_winner(const std::string& giveaway_id,
                     const std::string& winner_entry_id,
                     const std::string& winner_user_id) override;

    // Winner (entry_id, user_id) recorded by the finalizer, if any.
    std::optional<std::pair<std::string, std::string>> get_winner(const std::string& giveaway_id);

private:
    std::map<std::string, SeedCommitment> commitments_;
    std::map<std::string, FairnessProof> proofs_;
    std::map<std::string, std::pair<std::string, std::string>> winners_;
    std::mutex mutex_;
};

}
