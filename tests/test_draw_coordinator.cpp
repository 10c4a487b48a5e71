#include <gtest/gtest.h>
#include "draw_coordinator.hpp"
#include "memory_store.hpp"
#include "metrics.hpp"
#include "verifier.hpp"
#include "crypto.hpp"
#include "fairness_error.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <functional>

using namespace fairdraw;
using namespace fairdraw::testing_support;

class DrawCoordinatorTest : public ::testing::Test {
protected:
    static constexpr int64_t T0 = 1700000000;
    static constexpr int64_t CLOSE = T0 + 3600;

    void SetUp() override {
        MetricsRegistry::instance().reset();
    }

    void expect_code(ErrorCode code, const std::function<void()>& fn) {
        try {
            fn();
            FAIL() << "expected " << error_code_name(code);
        } catch (const FairnessError& e) {
            EXPECT_EQ(e.code(), code) << e.what();
        }
    }

    MemoryStore store;
    FlakyStore flaky{store};
    FixedRandomSource random{static_cast<unsigned char>(0x5c)};
    ManualClock clock{T0};
    SeedCommitmentManager seeds{flaky, random, clock.fn()};
    WinnerSelector selector;
    ProofRecorder recorder{flaky, &store, DisclosureMode::FULL, clock.fn()};
    DrawCoordinator coordinator{flaky, seeds, selector, recorder, clock.fn()};
};

TEST_F(DrawCoordinatorTest, FullLifecycle) {
    auto entries = make_entries(50);
    EXPECT_EQ(coordinator.lifecycle_state("g1"), LifecycleState::UNCOMMITTED);

    auto published = seeds.commit("g1", from_unix_seconds(CLOSE));
    EXPECT_EQ(coordinator.lifecycle_state("g1"), LifecycleState::COMMITTED);

    clock.set(CLOSE);
    EXPECT_EQ(coordinator.lifecycle_state("g1"), LifecycleState::CLOSED);

    auto proof = coordinator.run_draw("g1", from_unix_seconds(CLOSE), entries);
    EXPECT_EQ(coordinator.lifecycle_state("g1"), LifecycleState::PROVEN);

    EXPECT_EQ(proof.commitment, published.commitment);
    EXPECT_EQ(proof.seed, crypto::to_hex(Bytes(SEED_BYTES, 0x5c)));
    EXPECT_EQ(proof.total_entries, 50u);

    auto expected = select_winner(Bytes(SEED_BYTES, 0x5c), entries);
    EXPECT_EQ(proof.winner_entry_id, expected.winner.entry_id);

    auto winner = store.get_winner("g1");
    ASSERT_TRUE(winner.has_value());
    EXPECT_EQ(winner->first, proof.winner_entry_id);

    EXPECT_TRUE(Verifier::verify(proof, entries).valid);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("draws_total"), 1.0);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("integrity_failures_total"), 0.0);
}

TEST_F(DrawCoordinatorTest, DrawBeforeCloseRejected) {
    seeds.commit("g1", from_unix_seconds(CLOSE));
    clock.set(CLOSE - 1);
    expect_code(ErrorCode::PREMATURE_REVEAL,
                [&] { coordinator.run_draw("g1", from_unix_seconds(CLOSE), make_entries(3)); });
    EXPECT_FALSE(store.get_commitment("g1")->revealed);
    EXPECT_FALSE(store.get_proof("g1").has_value());
}

TEST_F(DrawCoordinatorTest, DrawWithEarlierCloseTimeStillWaitsForCommittedClose) {
    seeds.commit("g1", from_unix_seconds(CLOSE));
    clock.set(T0 + 1);
    expect_code(ErrorCode::PREMATURE_REVEAL,
                [&] { coordinator.run_draw("g1", from_unix_seconds(0), make_entries(3)); });
    EXPECT_FALSE(store.get_commitment("g1")->revealed);
    EXPECT_EQ(coordinator.lifecycle_state("g1"), LifecycleState::COMMITTED);
}

TEST_F(DrawCoordinatorTest, DrawWithoutCommitRejected) {
    clock.set(CLOSE);
    expect_code(ErrorCode::NOT_COMMITTED,
                [&] { coordinator.run_draw("g1", from_unix_seconds(CLOSE), make_entries(3)); });
}

TEST_F(DrawCoordinatorTest, SecondDrawRejected) {
    auto entries = make_entries(5);
    seeds.commit("g1", from_unix_seconds(CLOSE));
    clock.set(CLOSE);
    auto first = coordinator.run_draw("g1", from_unix_seconds(CLOSE), entries);

    auto reordered = entries;
    std::reverse(reordered.begin(), reordered.end());
    expect_code(ErrorCode::PROOF_ALREADY_EXISTS,
                [&] { coordinator.run_draw("g1", from_unix_seconds(CLOSE), reordered); });
    EXPECT_EQ(store.get_proof("g1")->winner_entry_id, first.winner_entry_id);
}

TEST_F(DrawCoordinatorTest, InvalidEntriesDoNotRevealSeed) {
    seeds.commit("g1", from_unix_seconds(CLOSE));
    clock.set(CLOSE);

    expect_code(ErrorCode::NO_ELIGIBLE_ENTRIES,
                [&] { coordinator.run_draw("g1", from_unix_seconds(CLOSE), {}); });

    auto dupes = make_entries(4);
    dupes[3].deterministic_input = dupes[0].deterministic_input;
    expect_code(ErrorCode::DUPLICATE_ENTRY_INPUT,
                [&] { coordinator.run_draw("g1", from_unix_seconds(CLOSE), dupes); });

    EXPECT_FALSE(store.get_commitment("g1")->revealed);
    EXPECT_EQ(coordinator.lifecycle_state("g1"), LifecycleState::CLOSED);
}

TEST_F(DrawCoordinatorTest, FailedProofWriteResumesFromRevealedSeed) {
    auto entries = make_entries(12);
    seeds.commit("g1", from_unix_seconds(CLOSE));
    clock.set(CLOSE);

    flaky.fail_proof = true;
    expect_code(ErrorCode::STORAGE_UNAVAILABLE,
                [&] { coordinator.run_draw("g1", from_unix_seconds(CLOSE), entries); });
    EXPECT_EQ(coordinator.lifecycle_state("g1"), LifecycleState::REVEALED);
    EXPECT_FALSE(store.get_winner("g1").has_value());

    flaky.fail_proof = false;
    int generated = random.calls;
    auto proof = coordinator.run_draw("g1", from_unix_seconds(CLOSE), entries);
    EXPECT_EQ(random.calls, generated);
    EXPECT_EQ(proof.seed, crypto::to_hex(Bytes(SEED_BYTES, 0x5c)));
    EXPECT_TRUE(Verifier::verify(proof, entries).valid);
    EXPECT_EQ(coordinator.lifecycle_state("g1"), LifecycleState::PROVEN);
}

TEST_F(DrawCoordinatorTest, FailedRevealLeavesCommitmentSealed) {
    seeds.commit("g1", from_unix_seconds(CLOSE));
    clock.set(CLOSE);

    flaky.fail_reveal = true;
    expect_code(ErrorCode::STORAGE_UNAVAILABLE,
                [&] { coordinator.run_draw("g1", from_unix_seconds(CLOSE), make_entries(3)); });
    EXPECT_FALSE(store.get_commitment("g1")->revealed);
    EXPECT_FALSE(store.get_proof("g1").has_value());
}

TEST_F(DrawCoordinatorTest, IndependentGiveawaysDoNotInterfere) {
    seeds.commit("g1", from_unix_seconds(CLOSE));
    seeds.commit("g2", from_unix_seconds(CLOSE + 600));
    clock.set(CLOSE);

    coordinator.run_draw("g1", from_unix_seconds(CLOSE), make_entries(6, "a"));
    EXPECT_EQ(coordinator.lifecycle_state("g1"), LifecycleState::PROVEN);
    EXPECT_EQ(coordinator.lifecycle_state("g2"), LifecycleState::COMMITTED);

    expect_code(ErrorCode::PREMATURE_REVEAL,
                [&] { coordinator.run_draw("g2", from_unix_seconds(CLOSE + 600), make_entries(6, "b")); });
}
