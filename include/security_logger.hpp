#pragma once

#include <string>
#include <iostream>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace fairdraw {

// Audit log for the fairness pipeline and its HTTP surface.
// Remote addresses are blinded with a rotating salt; engine components log
// with remote_addr "internal". Seeds must never be passed in a message before
// they are revealed.
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        SEED_COMMITTED,
        SEED_REVEALED,
        WINNER_SELECTED,
        PROOF_RECORDED,
        PROOF_VERIFIED,
        VERIFICATION_FAILED,
        SEQUENCE_VIOLATION,
        INTEGRITY_FAILURE,
        STORAGE_FAILURE,
        RATE_LIMIT_HIT,
        AUTH_FAILURE,
        INVALID_INPUT,
        CONNECTION_REJECTED,
        LIFECYCLE
    };

    /**
     * Records an audit event.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param remote_addr Source IP address (blinded before logging), or "internal".
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                   const std::string& message = "") {
        std::stringstream ss;
        ss << "[" << utc_now() << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "src=" << blind_address(remote_addr);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::SEED_COMMITTED: return "SEED_COMMITTED";
            case EventType::SEED_REVEALED: return "SEED_REVEALED";
            case EventType::WINNER_SELECTED: return "WINNER_SELECTED";
            case EventType::PROOF_RECORDED: return "PROOF_RECORDED";
            case EventType::PROOF_VERIFIED: return "PROOF_VERIFIED";
            case EventType::VERIFICATION_FAILED: return "VERIFY_FAILED";
            case EventType::SEQUENCE_VIOLATION: return "SEQUENCE";
            case EventType::INTEGRITY_FAILURE: return "INTEGRITY";
            case EventType::STORAGE_FAILURE: return "STORAGE";
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::AUTH_FAILURE: return "AUTH_FAILURE";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::string utc_now() {
        auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        std::stringstream ss;
        ss << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    // Client addresses are hashed with a salt rotated every 6 hours, so past
    // log lines cannot be linked back to an address once the salt is gone.
    static std::string blind_address(const std::string& remote_addr) {
        if (remote_addr == "internal" || remote_addr == "unknown") {
            return remote_addr;
        }

        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, 32) != 1) {
                    std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                    std::terminate();
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now_steady;
            }
            salt = log_salt;
        }

        std::string data = remote_addr + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }
};

}
