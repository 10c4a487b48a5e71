#pragma once

#include <string>
#include <unordered_map>
#include <shared_mutex>

namespace fairdraw {

// Tracks open HTTP connections per blinded client address.
class ConnectionManager {
public:
    explicit ConnectionManager(const std::string& salt);
    ~ConnectionManager() = default;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Total open connections across all addresses.
    size_t connection_count() const;

    size_t connection_count_for_ip(const std::string& ip_address) const;

    // Returns false (and counts nothing) when the address is at its limit.
    bool increment_ip_count(const std::string& ip, size_t limit);
    void decrement_ip_count(const std::string& ip);

    // Salted SHA-256 of an identifier; used for rate-limit keys.
    std::string blind_id(const std::string& id) const;

private:
    std::unordered_map<std::string, size_t> ip_counts_;
    size_t total_ = 0;

    mutable std::shared_mutex connections_mutex_;
    std::string salt_;
};

}
