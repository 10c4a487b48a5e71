#pragma once

#include <vector>

#include "fairness_types.hpp"

namespace fairdraw {

// Independent proof verification. Needs nothing beyond the published proof
// (and, for strong mode, the operator's entry list), never mutates state and
// never throws for a bad proof: every problem is an itemised reason.
class Verifier {
public:
    // Weak mode: confirms the commitment and the winner's own keyed value.
    // Says nothing about whether another entry would have scored higher.
    static VerificationResult verify(const FairnessProof& proof);

    // Strong mode: weak checks plus a full re-run of the selection.
    static VerificationResult verify(const FairnessProof& proof, const std::vector<Entry>& entries);
};

}
