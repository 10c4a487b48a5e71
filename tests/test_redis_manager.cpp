#include <gtest/gtest.h>
#include "redis_manager.hpp"
#include "server_config.hpp"
#include "seed_commitment_manager.hpp"
#include "draw_coordinator.hpp"
#include "fairness_error.hpp"
#include "crypto.hpp"
#include "test_support.hpp"
#include <chrono>
#include <memory>

using namespace fairdraw;
using namespace fairdraw::testing_support;

class RedisManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.redis_url = "tcp://127.0.0.1:6379?socket_timeout=100ms";
        redis = std::make_unique<RedisManager>(config);

        if (redis->is_connected()) {
            redis->purge_giveaway("redis_test_g1");
        }
    }

    void TearDown() override {
        if (redis->is_connected()) {
            redis->purge_giveaway("redis_test_g1");
        }
    }

    SeedCommitment sample_commitment() {
        SeedCommitment record;
        record.giveaway_id = "redis_test_g1";
        record.creator_id = "creator";
        record.seed = Bytes(SEED_BYTES, 0x33);
        record.commitment = crypto::commitment_for(record.seed);
        record.committed_at = from_unix_seconds(1700000000);
        record.entries_close_at = from_unix_seconds(1700003600);
        return record;
    }

    ServerConfig config;
    std::unique_ptr<RedisManager> redis;
};

TEST_F(RedisManagerTest, ConnectionStatus) {
    if (!redis->is_connected()) {
        GTEST_SKIP() << "Redis not available at 127.0.0.1:6379";
    }
    EXPECT_TRUE(redis->ping());
}

TEST_F(RedisManagerTest, KeysAreNamespacedPerGiveaway) {
    EXPECT_EQ(RedisManager::seed_key("g1"), "fairdraw:seed:g1");
    EXPECT_EQ(RedisManager::reveal_key("g1"), "fairdraw:reveal:g1");
    EXPECT_EQ(RedisManager::proof_key("g1"), "fairdraw:proof:g1");
    EXPECT_EQ(RedisManager::winner_key("g1"), "fairdraw:winner:g1");
}

TEST_F(RedisManagerTest, CommitmentIsWriteOnce) {
    if (!redis->is_connected()) GTEST_SKIP();

    auto record = sample_commitment();
    EXPECT_EQ(redis->create_commitment(record), WriteStatus::OK);

    auto other = record;
    other.seed = Bytes(SEED_BYTES, 0x44);
    other.commitment = crypto::commitment_for(other.seed);
    EXPECT_EQ(redis->create_commitment(other), WriteStatus::EXISTS);

    auto stored = redis->get_commitment("redis_test_g1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->commitment, record.commitment);
    EXPECT_EQ(stored->seed, record.seed);
    EXPECT_FALSE(stored->revealed);
}

TEST_F(RedisManagerTest, RevealMarkerIsAtomic) {
    if (!redis->is_connected()) GTEST_SKIP();

    EXPECT_EQ(redis->mark_revealed("redis_test_g1", from_unix_seconds(1700003700)), WriteStatus::MISSING);

    ASSERT_EQ(redis->create_commitment(sample_commitment()), WriteStatus::OK);
    EXPECT_EQ(redis->mark_revealed("redis_test_g1", from_unix_seconds(1700003700)), WriteStatus::OK);
    EXPECT_EQ(redis->mark_revealed("redis_test_g1", from_unix_seconds(1700003800)), WriteStatus::EXISTS);

    auto stored = redis->get_commitment("redis_test_g1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->revealed);
    ASSERT_TRUE(stored->revealed_at.has_value());
    EXPECT_EQ(to_unix_seconds(*stored->revealed_at), 1700003700);
}

TEST_F(RedisManagerTest, EndToEndDrawOnRedis) {
    if (!redis->is_connected()) GTEST_SKIP();

    FixedRandomSource random{static_cast<unsigned char>(0x77)};
    ManualClock clock{1700000000};
    SeedCommitmentManager seeds(*redis, random, clock.fn());
    WinnerSelector selector;
    ProofRecorder recorder(*redis, redis.get(), DisclosureMode::FULL, clock.fn());
    DrawCoordinator coordinator(*redis, seeds, selector, recorder, clock.fn());

    seeds.commit("redis_test_g1", from_unix_seconds(1700003600));
    clock.set(1700003600);
    auto entries = make_entries(20);
    auto proof = coordinator.run_draw("redis_test_g1", from_unix_seconds(1700003600), entries);

    auto stored = redis->get_proof("redis_test_g1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->winner_entry_id, proof.winner_entry_id);
    EXPECT_EQ(stored->records.size(), 20u);

    auto winner = redis->get_winner("redis_test_g1");
    ASSERT_TRUE(winner.has_value());
    EXPECT_EQ(winner->first, proof.winner_entry_id);
    EXPECT_EQ(winner->second, proof.winner_user_id);

    EXPECT_EQ(redis->create_proof(proof), WriteStatus::EXISTS);
}

TEST_F(RedisManagerTest, DisconnectedStoreReportsUnavailable) {
    ServerConfig bad;
    bad.redis_url = "tcp://127.0.0.1:1?socket_timeout=100ms&connect_timeout=100ms";
    RedisManager offline(bad);
    ASSERT_FALSE(offline.is_connected());

    EXPECT_EQ(offline.create_commitment(sample_commitment()), WriteStatus::FAILED);
    EXPECT_FALSE(offline.mark_winner("redis_test_g1", "e1", "u1"));
    try {
        offline.get_commitment("redis_test_g1");
        FAIL() << "expected StorageUnavailable";
    } catch (const FairnessError& e) {
        EXPECT_EQ(e.code(), ErrorCode::STORAGE_UNAVAILABLE);
    }
}

TEST_F(RedisManagerTest, LuaRateLimiter) {
    if (!redis->is_connected()) GTEST_SKIP();

    std::string key = "rl_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
    int limit = 2;
    int window = 10;

    auto r1 = redis->rate_limit(key, limit, window);
    EXPECT_TRUE(r1.allowed);

    auto r2 = redis->rate_limit(key, limit, window);
    EXPECT_TRUE(r2.allowed);

    auto r3 = redis->rate_limit(key, limit, window);
    EXPECT_FALSE(r3.allowed);
}
