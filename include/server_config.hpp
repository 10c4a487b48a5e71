#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace fairdraw {

enum class DisclosureMode {
    FULL,        // Proof embeds every entry's keyed value
    WINNER_ONLY  // Proof keeps the winner's record and total_entries
};

enum class StorageBackend {
    REDIS,
    MEMORY
};

inline const std::string DEFAULT_SECRET_SALT = "CHANGE_ME_IN_PRODUCTION_VIA_ENV";

// Service configuration and draw policy.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Storage ---
    StorageBackend storage = StorageBackend::REDIS;
    std::string redis_url = "tcp://127.0.0.1:6379";

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Connection & Resource Management ---
    size_t max_request_size = 8 * 1024 * 1024;  // Entry lists for large draws
    size_t max_connections_per_ip = 10;
    size_t max_global_connections = 10000;
    int connection_timeout_sec = 60;

    // --- Per-Endpoint API Limits (Requests per window, managed by Redis) ---
    int global_rate_limit = 120;     // Window: 10s
    int commitment_read_limit = 60;  // Window: 60s
    int proof_read_limit = 60;       // Window: 60s
    int verify_limit = 20;           // Window: 60s
    int admin_limit = 30;            // Window: 60s

    // --- Identity & Secrets ---
    std::string secret_salt = DEFAULT_SECRET_SALT;  // Blinds client IPs in rate-limit keys
    std::string admin_token = "";  // Required for commit/draw and for remote metrics access

    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {};

    // --- Draw Policy ---
    DisclosureMode disclosure = DisclosureMode::FULL;
    size_t max_entries_per_draw = 1000000;
    size_t selection_parallel_threshold = 20000;  // Entry count at which hashing fans out
    int selection_worker_threads = 0;             // 0 defaults to hardware concurrency
    size_t max_json_depth = 16;
};

// Applies FAIRDRAW_* environment variables on top of the given configuration.
// Throws std::invalid_argument for unparsable values.
void apply_env_overrides(ServerConfig& config);

DisclosureMode parse_disclosure_mode(const std::string& value);
StorageBackend parse_storage_backend(const std::string& value);

}
