#include "server_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace fairdraw {

DisclosureMode parse_disclosure_mode(const std::string& value) {
    if (value == "full") return DisclosureMode::FULL;
    if (value == "winner_only") return DisclosureMode::WINNER_ONLY;
    throw std::invalid_argument("Unknown disclosure mode: " + value);
}

StorageBackend parse_storage_backend(const std::string& value) {
    if (value == "redis") return StorageBackend::REDIS;
    if (value == "memory") return StorageBackend::MEMORY;
    throw std::invalid_argument("Unknown storage backend: " + value);
}

void apply_env_overrides(ServerConfig& config) {
    if (const char* e = std::getenv("FAIRDRAW_PORT")) {
        config.port = static_cast<uint16_t>(std::stoi(e));
    }
    if (const char* e = std::getenv("FAIRDRAW_ADDR")) {
        config.address = e;
    }
    if (const char* e = std::getenv("FAIRDRAW_THREADS")) {
        config.thread_count = std::stoi(e);
    }
    if (const char* e = std::getenv("FAIRDRAW_STORAGE")) {
        config.storage = parse_storage_backend(e);
    }
    if (const char* e = std::getenv("FAIRDRAW_REDIS_URL")) {
        config.redis_url = e;
    }
    if (const char* e = std::getenv("FAIRDRAW_TLS")) {
        config.enable_tls = std::string(e) == "1" || std::string(e) == "true";
    }
    if (const char* e = std::getenv("FAIRDRAW_CERT_PATH")) {
        config.cert_path = e;
    }
    if (const char* e = std::getenv("FAIRDRAW_KEY_PATH")) {
        config.key_path = e;
    }
    if (const char* e = std::getenv("FAIRDRAW_SECRET_SALT")) {
        config.secret_salt = e;
    }
    if (const char* e = std::getenv("FAIRDRAW_ADMIN_TOKEN")) {
        config.admin_token = e;
    }
    if (const char* e = std::getenv("FAIRDRAW_MAX_CONNS_PER_IP")) {
        config.max_connections_per_ip = static_cast<size_t>(std::stoull(e));
    }
    if (const char* e = std::getenv("FAIRDRAW_MAX_REQUEST_SIZE")) {
        config.max_request_size = static_cast<size_t>(std::stoull(e));
    }
    if (const char* env_origins = std::getenv("FAIRDRAW_ALLOWED_ORIGINS")) {
        config.allowed_origins.clear();
        std::string origins_str(env_origins);
        size_t pos = 0;
        while ((pos = origins_str.find(',')) != std::string::npos) {
            config.allowed_origins.push_back(origins_str.substr(0, pos));
            origins_str.erase(0, pos + 1);
        }
        if (!origins_str.empty()) {
            config.allowed_origins.push_back(origins_str);
        }
    }

    // Granular Rate Limits
    if (const char* e = std::getenv("FAIRDRAW_LIMIT_GLOBAL")) config.global_rate_limit = std::stoi(e);
    if (const char* e = std::getenv("FAIRDRAW_LIMIT_COMMITMENT")) config.commitment_read_limit = std::stoi(e);
    if (const char* e = std::getenv("FAIRDRAW_LIMIT_PROOF")) config.proof_read_limit = std::stoi(e);
    if (const char* e = std::getenv("FAIRDRAW_LIMIT_VERIFY")) config.verify_limit = std::stoi(e);
    if (const char* e = std::getenv("FAIRDRAW_LIMIT_ADMIN")) config.admin_limit = std::stoi(e);

    // Draw policy
    if (const char* e = std::getenv("FAIRDRAW_DISCLOSURE")) {
        config.disclosure = parse_disclosure_mode(e);
    }
    if (const char* e = std::getenv("FAIRDRAW_MAX_ENTRIES")) {
        config.max_entries_per_draw = static_cast<size_t>(std::stoull(e));
    }
    if (const char* e = std::getenv("FAIRDRAW_PARALLEL_THRESHOLD")) {
        config.selection_parallel_threshold = static_cast<size_t>(std::stoull(e));
    }
    if (const char* e = std::getenv("FAIRDRAW_SELECTION_THREADS")) {
        config.selection_worker_threads = std::stoi(e);
    }
}

}
