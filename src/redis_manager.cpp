#include "redis_manager.hpp"
#include "server_config.hpp"
#include "fairness_error.hpp"
#include "input_validator.hpp"
#include "proof_codec.hpp"
#include "security_logger.hpp"
#include <iostream>
#include <chrono>
#include <iterator>
#include <unordered_map>
#include <boost/json.hpp>

namespace fairdraw {

RedisManager::RedisManager(const ServerConfig& config)
    : max_json_depth_(config.max_json_depth) {
    try {
        // Initialize the Redis client using the provided connection string.
        redis_ = std::make_unique<sw::redis::Redis>(config.redis_url);
        redis_->ping();
        connected_ = true;

        // Commitments must survive a restart between commit and reveal.
        try {
            std::vector<std::string> aof;
            redis_->command("CONFIG", "GET", "appendonly", std::back_inserter(aof));
            if (aof.size() >= 2 && aof[1] != "yes") {
                std::cerr << "[!] Warning: Redis appendonly is disabled; unrevealed seeds may be lost on restart.\n";
            }
        } catch (const sw::redis::Error&) {
            std::cerr << "[!] Warning: Could not read Redis persistence policy via CONFIG GET.\n";
        }

        std::cout << "[*] Redis connected: " << config.redis_url << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis connection failed: " << e.what() << "\n";
        connected_ = false;
    }
}

bool RedisManager::ping() {
    if (!redis_) return false;
    try {
        redis_->ping();
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        std::cerr << "[!] Redis ping failed: " << e.what() << "\n";
        connected_ = false;
    }
    return connected_;
}

// Atomic Token-Bucket implementation using Redis Lua scripting.
// This handles rate-limiting, temporary jail (bans), and violation tracking.
RateLimitResult RedisManager::rate_limit(const std::string& key, int limit, int period_sec, int cost) {
    RateLimitResult result = {true, (long long)0, (long long)limit, 0};

    if (!connected_) return result;

    try {
        static const std::string script = R"(
            local key = KEYS[1]
            local burst = tonumber(ARGV[1])
            local period = tonumber(ARGV[2])
            local now = tonumber(ARGV[3])
            local cost = tonumber(ARGV[4])

            local emission_interval = period / burst
            local jail_key = key .. ":jail"
            local violation_key = key .. ":viol"

            local jail_ttl = redis.call('TTL', jail_key)
            if jail_ttl > 0 then
                return {-1, 0, jail_ttl}
            end

            -- Theoretical Arrival Time (TAT)
            local tat = redis.call('GET', key)
            if not tat then
                tat = now
            else
                tat = tonumber(tat)
            end

            local tat_val = tat
            local increment = emission_interval * cost

            if tat_val < now then
                tat_val = now
            end

            if tat_val + increment - now > period then
                local retry_after = tat_val + increment - now - period
                local viol = redis.call('INCR', violation_key)
                if viol == 1 then
                    redis.call('EXPIRE', violation_key, period * 2)
                end

                if viol > 5 then
                     redis.call('SETEX', jail_key, 300, "banned")
                     return {-1, 0, 300}
                end

                return {0, math.ceil(retry_after), 0}
            end

            local new_tat = tat_val + increment
            redis.call('SET', key, new_tat, 'EX', period * 2)

            local remaining_count = math.floor((period - (new_tat - now)) / emission_interval)
            return {1, remaining_count, 0}
        )";

        auto now = std::chrono::system_clock::now();
        double now_sec = std::chrono::duration<double>(now.time_since_epoch()).count();

        std::vector<std::string> args = {
            std::to_string(limit),
            std::to_string(period_sec),
            std::to_string(now_sec),
            std::to_string(cost)
        };

        std::vector<long long> res;
        std::vector<std::string> keys = {"fairdraw:rl:" + key};
        redis_->eval(script, keys.begin(), keys.end(), args.begin(), args.end(), std::back_inserter(res));

        if (res.size() >= 3) {
            int status = (int)res[0];
            if (status == 1) {
                result.allowed = true;
                result.current = limit - res[1];
                result.reset_after_sec = 0;
            } else if (status == -1) {
                result.allowed = false;
                result.current = limit;
                result.reset_after_sec = res[2];
            } else {
                result.allowed = false;
                result.current = limit;
                result.reset_after_sec = res[1];
            }
        }
        return result;
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis rate limit error: " << e.what() << "\n";
        return result;
    }
}

WriteStatus RedisManager::set_if_absent(const std::string& key, const std::string& value, const char* what) {
    if (!connected_) return WriteStatus::FAILED;
    try {
        bool created = redis_->set(key, value, std::chrono::milliseconds(0), sw::redis::UpdateType::NOT_EXIST);
        return created ? WriteStatus::OK : WriteStatus::EXISTS;
    } catch (const sw::redis::Error& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            "internal", std::string("Redis ") + what + " write failed: " + e.what());
        return WriteStatus::FAILED;
    }
}

std::optional<std::string> RedisManager::get_value(const std::string& key, const char* what) {
    if (!connected_) {
        throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, "redis not connected");
    }
    try {
        auto val = redis_->get(key);
        if (val) return *val;
        return std::nullopt;
    } catch (const sw::redis::Error& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            "internal", std::string("Redis ") + what + " read failed: " + e.what());
        throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, e.what());
    }
}

WriteStatus RedisManager::create_commitment(const SeedCommitment& record) {
    SeedCommitment fresh = record;
    fresh.revealed = false;
    fresh.revealed_at.reset();
    return set_if_absent(seed_key(record.giveaway_id),
                         boost::json::serialize(codec::to_json(fresh, true)), "commitment");
}

std::optional<SeedCommitment> RedisManager::get_commitment(const std::string& giveaway_id) {
    auto raw = get_value(seed_key(giveaway_id), "commitment");
    if (!raw) return std::nullopt;

    SeedCommitment record;
    try {
        record = codec::commitment_from_json(InputValidator::safe_parse_json(*raw, max_json_depth_));
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::STORAGE_FAILURE,
                            "internal", "Corrupt commitment record for giveaway " + giveaway_id + ": " + e.what());
        throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, "corrupt commitment record");
    }

    // The reveal marker is authoritative for the revealed flag.
    auto revealed_at = get_value(reveal_key(giveaway_id), "reveal");
    record.revealed = revealed_at.has_value();
    record.revealed_at.reset();
    if (revealed_at) {
        try {
            record.revealed_at = from_unix_seconds(std::stoll(*revealed_at));
        } catch (const std::exception&) {
            throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, "corrupt reveal marker");
        }
    }
    return record;
}

WriteStatus RedisManager::mark_revealed(const std::string& giveaway_id, Timestamp revealed_at) {
    if (!connected_) return WriteStatus::FAILED;
    try {
        // Existence check and SET NX in one step so a reveal cannot land on a missing commitment.
        static const std::string script = R"(
            if redis.call('EXISTS', KEYS[1]) == 0 then
                return 0
            end
            if redis.call('SET', KEYS[2], ARGV[1], 'NX') then
                return 1
            end
            return -1
        )";

        auto status = redis_->eval<long long>(script,
                                              {seed_key(giveaway_id), reveal_key(giveaway_id)},
                                              {std::to_string(to_unix_seconds(revealed_at))});
        if (status == 1) return WriteStatus::OK;
        if (status == 0) return WriteStatus::MISSING;
        return WriteStatus::EXISTS;
    } catch (const sw::redis::Error& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            "internal", std::string("Redis reveal write failed: ") + e.what());
        return WriteStatus::FAILED;
    }
}

WriteStatus RedisManager::create_proof(const FairnessProof& proof) {
    return set_if_absent(proof_key(proof.giveaway_id),
                         boost::json::serialize(codec::to_json(proof)), "proof");
}

std::optional<FairnessProof> RedisManager::get_proof(const std::string& giveaway_id) {
    auto raw = get_value(proof_key(giveaway_id), "proof");
    if (!raw) return std::nullopt;

    try {
        return codec::proof_from_json(InputValidator::safe_parse_json(*raw, max_json_depth_));
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::STORAGE_FAILURE,
                            "internal", "Corrupt proof record for giveaway " + giveaway_id + ": " + e.what());
        throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, "corrupt proof record");
    }
}

bool RedisManager::mark_winner(const std::string& giveaway_id,
                               const std::string& winner_entry_id,
                               const std::string& winner_user_id) {
    if (!connected_) return false;
    try {
        redis_->hmset(winner_key(giveaway_id), {
            std::make_pair(std::string("entry_id"), winner_entry_id),
            std::make_pair(std::string("user_id"), winner_user_id)
        });
        return true;
    } catch (const sw::redis::Error& e) {
        std::cerr << "[!] Redis mark_winner failed: " << e.what() << "\n";
        return false;
    }
}

std::optional<std::pair<std::string, std::string>> RedisManager::get_winner(const std::string& giveaway_id) {
    if (!connected_) {
        throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, "redis not connected");
    }
    try {
        std::unordered_map<std::string, std::string> fields;
        redis_->hgetall(winner_key(giveaway_id), std::inserter(fields, fields.end()));
        if (fields.empty()) return std::nullopt;
        return std::make_pair(fields["entry_id"], fields["user_id"]);
    } catch (const sw::redis::Error& e) {
        std::cerr << "[!] Redis get_winner failed: " << e.what() << "\n";
        throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, e.what());
    }
}

bool RedisManager::purge_giveaway(const std::string& giveaway_id) {
    if (!connected_) return false;
    try {
        redis_->del({seed_key(giveaway_id), reveal_key(giveaway_id),
                     proof_key(giveaway_id), winner_key(giveaway_id)});
        return true;
    } catch (const sw::redis::Error& e) {
        std::cerr << "[!] Redis purge failed: " << e.what() << "\n";
        return false;
    }
}

}
