#include <gtest/gtest.h>
#include "connection_manager.hpp"
#include "draw_coordinator.hpp"
#include "memory_store.hpp"
#include "winner_selector.hpp"
#include "fairness_error.hpp"
#include "test_support.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

using namespace fairdraw;
using namespace fairdraw::testing_support;

TEST(StressTest, ConcurrentCommitsOnlyOneWins) {
    MemoryStore store;
    FixedRandomSource random{static_cast<unsigned char>(0x01)};
    ManualClock clock{1700000000};
    SeedCommitmentManager seeds(store, random, clock.fn());

    const int num_threads = 8;
    std::atomic<int> committed{0};
    std::atomic<int> rejected{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&] {
            try {
                seeds.commit("contended", from_unix_seconds(1700003600));
                committed++;
            } catch (const FairnessError& e) {
                if (e.code() == ErrorCode::ALREADY_COMMITTED) rejected++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(committed, 1);
    EXPECT_EQ(rejected, num_threads - 1);
}

TEST(StressTest, ConcurrentDrawsProduceOneProof) {
    MemoryStore store;
    FixedRandomSource random{static_cast<unsigned char>(0x02)};
    ManualClock clock{1700000000};
    SeedCommitmentManager seeds(store, random, clock.fn());
    WinnerSelector selector;
    ProofRecorder recorder(store, &store, DisclosureMode::WINNER_ONLY, clock.fn());
    DrawCoordinator coordinator(store, seeds, selector, recorder, clock.fn());

    seeds.commit("g1", from_unix_seconds(1700003600));
    clock.set(1700003600);
    auto entries = make_entries(500);

    const int num_threads = 6;
    std::atomic<int> drawn{0};
    std::vector<std::string> winners(num_threads);
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i] {
            try {
                winners[i] = coordinator.run_draw("g1", from_unix_seconds(1700003600), entries).winner_entry_id;
                drawn++;
            } catch (const FairnessError&) {
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // Losing racers either saw the reveal or the proof already taken.
    EXPECT_EQ(drawn, 1);
    auto proof = store.get_proof("g1");
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->winner_entry_id, select_winner(Bytes(SEED_BYTES, 0x02), entries).winner.entry_id);
}

TEST(StressTest, LargeSelectionThroughput) {
    auto entries = make_entries(100000);
    Bytes seed(SEED_BYTES, 0x03);

    WinnerSelector::Options options;
    options.parallel_threshold = 1000;
    options.worker_threads = 4;
    WinnerSelector parallel(options);

    auto start = std::chrono::high_resolution_clock::now();
    auto outcome = parallel.select_winner(seed, entries);
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] Scored " << entries.size() << " entries in " << diff.count() << "s" << std::endl;

    EXPECT_EQ(outcome.all_keyed_values.size(), entries.size());
    EXPECT_EQ(outcome.winner.entry_id, select_winner(seed, entries).winner.entry_id);
}

TEST(StressTest, ConnectionManagerHighConcurrency) {
    ConnectionManager cm("stress_salt");
    const int num_threads = 8;
    const int conns_per_thread = 500;

    auto worker = [&](int thread_id) {
        std::string ip = "10.0." + std::to_string(thread_id) + ".1";
        for (int i = 0; i < conns_per_thread; ++i) {
            if (cm.increment_ip_count(ip, conns_per_thread)) {
                cm.decrement_ip_count(ip);
            }
        }
        cm.increment_ip_count(ip, conns_per_thread);
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(cm.connection_count(), static_cast<size_t>(num_threads));
}
