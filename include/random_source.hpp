#pragma once

#include <string>
#include <openssl/rand.h>

#include "fairness_error.hpp"
#include "fairness_types.hpp"

namespace fairdraw {

// Source of secret seed material. Injected into the SeedCommitmentManager so
// tests can substitute a deterministic source.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual Bytes generate(size_t num_bytes) = 0;
};

// Production source backed by the OpenSSL CSPRNG.
class OpenSslRandomSource : public RandomSource {
public:
    Bytes generate(size_t num_bytes) override {
        Bytes buffer(num_bytes);
        if (num_bytes == 0) return buffer;

        if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
            throw FairnessError(ErrorCode::ENTROPY_FAILURE, "CSPRNG failure - entropy exhausted");
        }
        return buffer;
    }
};

}
