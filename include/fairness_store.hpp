#pragma once

#include <optional>
#include <string>

#include "fairness_types.hpp"

namespace fairdraw {

enum class WriteStatus {
    OK,
    EXISTS,   // Create-if-absent target already present
    MISSING,  // Record the write depends on does not exist
    FAILED    // Backend error; nothing was written
};

// Abstract persistence for commitment and proof records.
// Every write is create-if-absent so that two racing writers cannot both
// succeed. Reads throw FairnessError(STORAGE_UNAVAILABLE) on backend failure
// and return std::nullopt only when the record does not exist.
class FairnessStore {
public:
    virtual ~FairnessStore() = default;

    /**
     * Persists a fresh commitment (revealed = false).
     * @return EXISTS if a commitment for the giveaway is already stored.
     */
    virtual WriteStatus create_commitment(const SeedCommitment& record) = 0;

    virtual std::optional<SeedCommitment> get_commitment(const std::string& giveaway_id) = 0;

    /**
     * Flips the revealed flag exactly once.
     * @return MISSING without a commitment, EXISTS if already revealed.
     */
    virtual WriteStatus mark_revealed(const std::string& giveaway_id, Timestamp revealed_at) = 0;

    virtual WriteStatus create_proof(const FairnessProof& proof) = 0;

    virtual std::optional<FairnessProof> get_proof(const std::string& giveaway_id) = 0;
};

}
