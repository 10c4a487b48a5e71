#pragma once

#include <string>

#include "redis_manager.hpp"

namespace fairdraw {

// Thin wrapper over RedisManager providing distributed rate limiting.
// Without a connected Redis (memory backend, outage) every request is allowed.
class RateLimiter {
public:
    explicit RateLimiter(RedisManager* redis);
    ~RateLimiter() = default;

    /**
     * Evaluates a rate-limit request against a specific key (e.g., blinded IP).
     * @param key Unique identifier for the rate-limit bucket.
     * @param limit Maximum number of tokens/requests allowed.
     * @param window_sec Period for the token-bucket window.
     * @param cost Resource cost of the current operation.
     * @return Detailed success/failure result with retry metadata.
     */
    RateLimitResult check(const std::string& key, int limit, int window_sec, int cost = 1);

    bool is_distributed() const { return redis_ != nullptr && redis_->is_connected(); }

private:
    RedisManager* redis_;
};

}
