#include <gtest/gtest.h>
#include "input_validator.hpp"
#include "proof_codec.hpp"
#include "verifier.hpp"
#include <string>
#include <vector>
#include <random>
#include <stdexcept>
#include <cctype>

using namespace fairdraw;

namespace {

// Parses and verifies; any rejection must surface as a parse error, never a crash.
void parse_and_verify(const std::string& input) {
    try {
        auto value = InputValidator::safe_parse_json(input);
        auto proof = codec::proof_from_json(value);
        Verifier::verify(proof);
    } catch (const boost::system::system_error&) {
    } catch (const std::invalid_argument&) {
    }
}

}

TEST(FuzzTest, JsonParserHardening) {
    std::vector<std::string> malicious_inputs = {
        "{",
        "}",
        "[",
        "]",
        "{\"a\":",
        "{\"a\":}",
        "{\"a\":[]}",
        "{\"a\":" + std::string(1000, 'a') + "}",
        "{\"a\":" + std::string(1000, '[') + std::string(1000, ']') + "}",
        "null",
        "true",
        "123",
        "\"string\"",
        "",
        std::string(1, '\0'),
        "{\"\\u0000\": \"\\u0000\"}",
        "{\"a\": 1e1000}",
    };

    for (const auto& input : malicious_inputs) {
        EXPECT_NO_FATAL_FAILURE(parse_and_verify(input));
    }
}

TEST(FuzzTest, HostileProofFieldsNeverThrowFromVerifier) {
    std::vector<std::string> values = {"", "0", "zz", std::string(63, 'a'), std::string(65, 'f'),
                                       std::string(64, 'G'), std::string(4096, 'a')};
    for (const auto& seed : values) {
        for (const auto& digest : values) {
            FairnessProof proof;
            proof.seed = seed;
            proof.commitment = digest;
            proof.winner_keyed_value = digest;
            proof.winner_deterministic_input = "pay_1";
            proof.total_entries = 3;
            auto result = Verifier::verify(proof);
            EXPECT_FALSE(result.valid);
            EXPECT_FALSE(result.reasons.empty());
        }
    }
}

TEST(FuzzTest, RandomBytesIntoCodec) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> byte(0, 255);
    for (int round = 0; round < 500; ++round) {
        std::string input(static_cast<size_t>(byte(rng)), '\0');
        for (auto& c : input) c = static_cast<char>(byte(rng));
        parse_and_verify(input);
    }
    SUCCEED();
}

TEST(FuzzTest, IdentifierSanitization) {
    for (int i = 0; i < 256; ++i) {
        char c = static_cast<char>(i);
        bool allowed = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.' || c == ':';
        EXPECT_EQ(InputValidator::is_valid_identifier(std::string(1, c)), allowed) << "byte " << i;
    }
}
