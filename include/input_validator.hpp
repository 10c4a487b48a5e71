#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace fairdraw {

// Request-level validation for identifiers, digests and JSON bodies.
class InputValidator {
public:
    static constexpr size_t MAX_IDENTIFIER_LENGTH = 128;

    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;

        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }

    // Checks for a valid SHA256 hex hash (64 characters).
    static bool is_valid_hash(const std::string& hash) {
        return is_valid_hex(hash, 64);
    }

    /**
     * Giveaway, creator and entry identifiers: alphanumerics plus '_', '-', '.' and ':',
     * bounded length. They end up in storage keys and URL paths.
     */
    static bool is_valid_identifier(const std::string& str) {
        if (str.empty() || str.length() > MAX_IDENTIFIER_LENGTH) return false;
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.' || c == ':';
        });
    }

    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * Throws boost::system::system_error on malformed or too deeply nested input.
     */
    static boost::json::value safe_parse_json(const std::string& input, size_t max_depth = 16) {
        boost::json::parse_options opt;
        opt.max_depth = max_depth;
        return boost::json::parse(input, {}, opt);
    }
};

}
