#include "crypto.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace fairdraw {
namespace crypto {

Digest sha256(const unsigned char* data, size_t len) {
    Digest out;
    SHA256(data, len, out.data());
    return out;
}

Digest sha256(const Bytes& data) {
    return sha256(data.data(), data.size());
}

Digest hmac_sha256(const Bytes& key, const std::string& message) {
    Digest out;
    unsigned int out_len = 0;
    // HMAC() rejects a null key pointer even for a zero-length key.
    static const unsigned char empty_key = 0;
    const unsigned char* key_ptr = key.empty() ? &empty_key : key.data();

    if (HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(message.data()), message.size(),
             out.data(), &out_len) == nullptr || out_len != out.size()) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return out;
}

std::string to_hex(const unsigned char* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

std::optional<Bytes> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };

    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

std::optional<Digest> digest_from_hex(const std::string& hex) {
    if (hex.size() != SHA256_DIGEST_LENGTH * 2) return std::nullopt;
    auto bytes = from_hex(hex);
    if (!bytes) return std::nullopt;

    Digest out;
    std::copy(bytes->begin(), bytes->end(), out.begin());
    return out;
}

std::string commitment_for(const Bytes& seed) {
    return to_hex(sha256(seed));
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}
}
