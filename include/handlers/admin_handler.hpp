#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include "server_config.hpp"
#include "seed_commitment_manager.hpp"
#include "draw_coordinator.hpp"

namespace fairdraw {

namespace http = boost::beast::http;

// Operator endpoints driving the fairness lifecycle. Callers must have
// passed the admin token check before reaching these handlers.
class AdminHandler {
public:
    AdminHandler(const ServerConfig& config,
                 SeedCommitmentManager& seeds,
                 DrawCoordinator& coordinator)
        : config_(config)
        , seeds_(seeds)
        , coordinator_(coordinator) {}

    // Body: {"giveaway_id", "entries_close_at" (unix seconds), "creator_id"?}
    http::response<http::string_body> handle_commit(const http::request<http::string_body>& req,
                                                    const std::string& remote_addr);

    // Body: {"giveaway_id", "entries": [...], "entries_close_at"?}. The close
    // time defaults to the one recorded at commit.
    http::response<http::string_body> handle_draw(const http::request<http::string_body>& req,
                                                  const std::string& remote_addr);

    http::response<http::string_body> handle_state(const http::request<http::string_body>& req,
                                                   const std::string& giveaway_id);

private:
    const ServerConfig& config_;
    SeedCommitmentManager& seeds_;
    DrawCoordinator& coordinator_;

    http::response<http::string_body> reject(const http::request<http::string_body>& req,
                                             const std::string& remote_addr,
                                             const FairnessError& e);
};

}
