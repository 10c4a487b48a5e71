#include "rate_limiter.hpp"

namespace fairdraw {

RateLimiter::RateLimiter(RedisManager* redis)
    : redis_(redis)
{}

// Evaluates a rate limit request against the Redis-backed token bucket.
// Returns success/failure along with remaining capacity or retry wait time.
RateLimitResult RateLimiter::check(const std::string& key, int limit, int window_sec, int cost) {
    if (!is_distributed()) {
        return RateLimitResult{true, 0, limit, 0};
    }
    return redis_->rate_limit(key, limit, window_sec, cost);
}

}
