#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "connection_manager.hpp"
#include "redis_manager.hpp"
#include "metrics.hpp"

namespace fairdraw {

namespace http = boost::beast::http;

class HealthHandler {
public:
    // redis is null when the memory backend is configured.
    HealthHandler(const ServerConfig& config, ConnectionManager& conn_manager, RedisManager* redis)
        : config_(config), conn_manager_(conn_manager), redis_(redis) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_stats(const http::request<http::string_body>& req);
    http::response<http::string_body> handle_metrics(unsigned version);

    // Constant-time check of the X-Admin-Token header. Admin access is
    // disabled while no token is configured.
    bool verify_admin_request(const http::request<http::string_body>& req) const;

private:
    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    RedisManager* redis_;
};

}
