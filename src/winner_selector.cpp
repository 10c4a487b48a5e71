#include "winner_selector.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <numeric>
#include <thread>
#include <unordered_set>

#include "fairness_error.hpp"

namespace fairdraw {

bool WinnerSelector::outranks(const Digest& a, const std::string& input_a,
                              const Digest& b, const std::string& input_b) {
    int cmp = std::memcmp(a.data(), b.data(), a.size());
    if (cmp != 0) return cmp > 0;
    return input_a < input_b;
}

void WinnerSelector::validate_entries(const std::vector<Entry>& entries) {
    if (entries.empty()) {
        throw FairnessError(ErrorCode::NO_ELIGIBLE_ENTRIES, "entry set is empty");
    }

    std::unordered_set<std::string> inputs;
    std::unordered_set<std::string> ids;
    inputs.reserve(entries.size());
    ids.reserve(entries.size());

    for (const auto& entry : entries) {
        if (entry.deterministic_input.empty()) {
            throw FairnessError(ErrorCode::EMPTY_ENTRY_INPUT, "entry " + entry.entry_id + " has no deterministic input");
        }
        if (!inputs.insert(entry.deterministic_input).second) {
            throw FairnessError(ErrorCode::DUPLICATE_ENTRY_INPUT,
                                "deterministic input shared by more than one entry (entry " + entry.entry_id + ")");
        }
        if (!ids.insert(entry.entry_id).second) {
            throw FairnessError(ErrorCode::DUPLICATE_ENTRY_INPUT, "entry id " + entry.entry_id + " appears twice");
        }
    }
}

std::vector<Digest> WinnerSelector::score(const Bytes& seed,
                                          const std::vector<Entry>& entries,
                                          const std::vector<size_t>& order) const {
    std::vector<Digest> digests(order.size());

    auto hash_range = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            digests[i] = crypto::hmac_sha256(seed, entries[order[i]].deterministic_input);
        }
    };

    unsigned workers = options_.worker_threads;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }

    if (order.size() < options_.parallel_threshold || workers < 2) {
        hash_range(0, order.size());
        return digests;
    }

    // Each worker writes a disjoint slice, so the result does not depend on
    // scheduling.
    size_t chunk = (order.size() + workers - 1) / workers;
    std::vector<std::thread> threads;
    std::vector<std::exception_ptr> errors(workers);
    for (unsigned w = 0; w < workers; ++w) {
        size_t begin = w * chunk;
        size_t end = std::min(order.size(), begin + chunk);
        if (begin >= end) break;
        threads.emplace_back([&, w, begin, end] {
            try {
                hash_range(begin, end);
            } catch (...) {
                errors[w] = std::current_exception();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
    return digests;
}

SelectionOutcome WinnerSelector::select_winner(const Bytes& seed, const std::vector<Entry>& entries) const {
    validate_entries(entries);

    // Canonical ordering by entry_id; it fixes ordinals, not the winner.
    std::vector<size_t> order(entries.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return entries[a].entry_id < entries[b].entry_id;
    });

    auto digests = score(seed, entries, order);

    size_t best = 0;
    for (size_t i = 1; i < order.size(); ++i) {
        if (outranks(digests[i], entries[order[i]].deterministic_input,
                     digests[best], entries[order[best]].deterministic_input)) {
            best = i;
        }
    }

    SelectionOutcome outcome;
    outcome.winner = entries[order[best]];
    outcome.all_keyed_values.reserve(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        const Entry& entry = entries[order[i]];
        SelectionRecord record;
        record.entry_id = entry.entry_id;
        record.deterministic_input = entry.deterministic_input;
        record.keyed_value = crypto::to_hex(digests[i]);
        record.ordinal = i;
        outcome.all_keyed_values.push_back(std::move(record));
    }
    return outcome;
}

SelectionOutcome select_winner(const Bytes& seed, const std::vector<Entry>& entries) {
    return WinnerSelector().select_winner(seed, entries);
}

}
