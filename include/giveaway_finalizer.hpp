#pragma once

#include <string>

namespace fairdraw {

// Collaborator owning the Giveaway entity. Told once a proof exists so it can
// mark the giveaway as having a finalized winner.
class GiveawayFinalizer {
public:
    virtual ~GiveawayFinalizer() = default;

    virtual bool mark_winner(const std::string& giveaway_id,
                             const std::string& winner_entry_id,
                             const std::string& winner_user_id) = 0;
};

}
