#pragma once

#include <array>
#include <optional>
#include <string>
#include <openssl/sha.h>

#include "fairness_types.hpp"

namespace fairdraw {

using Digest = std::array<unsigned char, SHA256_DIGEST_LENGTH>;

// Thin wrappers over OpenSSL's one-shot digest primitives.
namespace crypto {

Digest sha256(const unsigned char* data, size_t len);
Digest sha256(const Bytes& data);

/**
 * HMAC-SHA256 with the raw seed bytes as key and the entry input as message.
 * @param key Secret key (the revealed seed).
 * @param message Arbitrary byte string.
 */
Digest hmac_sha256(const Bytes& key, const std::string& message);

std::string to_hex(const unsigned char* data, size_t len);

template <size_t N>
std::string to_hex(const std::array<unsigned char, N>& data) {
    return to_hex(data.data(), data.size());
}

inline std::string to_hex(const Bytes& data) {
    return to_hex(data.data(), data.size());
}

// Accepts upper or lower case; rejects odd length and non-hex characters.
std::optional<Bytes> from_hex(const std::string& hex);

// Parses exactly one SHA-256 sized hex digest.
std::optional<Digest> digest_from_hex(const std::string& hex);

// Commitment published for a seed: lowercase hex SHA-256 of the raw bytes.
std::string commitment_for(const Bytes& seed);

// Constant-time equality for equal-length inputs (CRYPTO_memcmp).
bool constant_time_equals(const std::string& a, const std::string& b);

}

}
