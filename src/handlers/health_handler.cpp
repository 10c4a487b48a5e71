#include "handlers/health_handler.hpp"
#include "handlers/response_builder.hpp"
#include "crypto.hpp"

namespace json = boost::json;

namespace fairdraw {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    bool storage_ok = true;
    if (config_.storage == StorageBackend::REDIS) {
        storage_ok = redis_ != nullptr && redis_->ping();
        response["storage"] = "redis";
    } else {
        response["storage"] = "memory";
    }
    response["status"] = storage_ok ? "healthy" : "degraded";
    response["storage_connected"] = storage_ok;
    response["disclosure"] = config_.disclosure == DisclosureMode::FULL ? "full" : "winner_only";
    response["selection_rule"] = SELECTION_RULE;
    response["tls"] = config_.enable_tls;

    return json_response(storage_ok ? http::status::ok : http::status::service_unavailable, version, response);
}

http::response<http::string_body> HealthHandler::handle_stats(const http::request<http::string_body>& req) {
    auto& metrics = MetricsRegistry::instance();
    json::object response;
    response["active_connections"] = static_cast<int64_t>(conn_manager_.connection_count());
    response["commits"] = metrics.get_counter("commits_total");
    response["reveals"] = metrics.get_counter("reveals_total");
    response["draws"] = metrics.get_counter("draws_total");
    response["proofs"] = metrics.get_counter("proofs_total");
    response["integrity_failures"] = metrics.get_counter("integrity_failures_total");

    return json_response(http::status::ok, req.version(), response);
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();
    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req) const {
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    return crypto::constant_time_equals(provided_token, config_.admin_token);
}

}
