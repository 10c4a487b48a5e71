#pragma once

#include <string>
#include <vector>

#include "crypto.hpp"
#include "fairness_types.hpp"

namespace fairdraw {

// Deterministic winner derivation.
//
// Every entry is scored with HMAC-SHA256(seed, deterministic_input). Scores
// are compared as full-width 256-bit big-endian unsigned integers, which is
// exactly lexicographic comparison of the raw digest bytes. Equal digests are
// broken in favour of the lexicographically smallest deterministic_input, so
// the winner is a function of the seed and the entry set alone.
class WinnerSelector {
public:
    struct Options {
        size_t parallel_threshold = 20000;  // Entry count at which hashing fans out
        unsigned worker_threads = 0;        // 0 defaults to hardware concurrency
    };

    WinnerSelector() = default;
    explicit WinnerSelector(Options options) : options_(options) {}

    /**
     * Runs one selection.
     * @param seed Revealed seed bytes (HMAC key).
     * @param entries Frozen entry set, in any order.
     * @throws FairnessError NO_ELIGIBLE_ENTRIES, EMPTY_ENTRY_INPUT, DUPLICATE_ENTRY_INPUT
     */
    SelectionOutcome select_winner(const Bytes& seed, const std::vector<Entry>& entries) const;

    // True when (a, input_a) beats (b, input_b) under the selection rule.
    static bool outranks(const Digest& a, const std::string& input_a,
                         const Digest& b, const std::string& input_b);

    // Throws the same FairnessError select_winner would for an invalid set.
    static void validate_entries(const std::vector<Entry>& entries);

private:
    std::vector<Digest> score(const Bytes& seed,
                              const std::vector<Entry>& entries,
                              const std::vector<size_t>& order) const;

    Options options_;
};

// Convenience wrapper with default options.
SelectionOutcome select_winner(const Bytes& seed, const std::vector<Entry>& entries);

}
