#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <optional>
#include <utility>
#include <sw/redis++/redis++.h>

#include "fairness_store.hpp"
#include "giveaway_finalizer.hpp"

namespace fairdraw {

struct ServerConfig;

struct RateLimitResult {
    bool allowed;
    long long current;
    long long limit;
    long long reset_after_sec;
};

// Redis-backed fairness state and rate limiting.
// Implements FairnessStore with SET NX create-if-absent writes, the
// GiveawayFinalizer winner marker, and an atomic token-bucket rate limiter.
class RedisManager : public FairnessStore, public GiveawayFinalizer {
public:
    explicit RedisManager(const ServerConfig& config);
    ~RedisManager() = default;

    // Connection health check.
    bool is_connected() const { return connected_; }

    // Round-trips a PING; updates the connection flag.
    bool ping();

    // --- Global Rate Limiting ---
    // Implements an atomic token-bucket rate limiter via Lua scripting.
    RateLimitResult rate_limit(const std::string& key, int limit, int period_sec, int cost = 1);

    // --- FairnessStore ---
    WriteStatus create_commitment(const SeedCommitment& record) override;
    std::optional<SeedCommitment> get_commitment(const std::string& giveaway_id) override;
    WriteStatus mark_revealed(const std::string& giveaway_id, Timestamp revealed_at) override;
    WriteStatus create_proof(const FairnessProof& proof) override;
    std::optional<FairnessProof> get_proof(const std::string& giveaway_id) override;

    // --- GiveawayFinalizer ---
    bool mark_winner(const std::string& giveaway_id,
                     const std::string& winner_entry_id,
                     const std::string& winner_user_id) override;

    // Winner (entry_id, user_id) written by mark_winner, if any.
    std::optional<std::pair<std::string, std::string>> get_winner(const std::string& giveaway_id);

    // Removes every key of a giveaway. Test and operator cleanup only.
    bool purge_giveaway(const std::string& giveaway_id);

    static std::string seed_key(const std::string& giveaway_id) { return "fairdraw:seed:" + giveaway_id; }
    static std::string reveal_key(const std::string& giveaway_id) { return "fairdraw:reveal:" + giveaway_id; }
    static std::string proof_key(const std::string& giveaway_id) { return "fairdraw:proof:" + giveaway_id; }
    static std::string winner_key(const std::string& giveaway_id) { return "fairdraw:winner:" + giveaway_id; }

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
    size_t max_json_depth_;

    WriteStatus set_if_absent(const std::string& key, const std::string& value, const char* what);
    std::optional<std::string> get_value(const std::string& key, const char* what);
};

}
