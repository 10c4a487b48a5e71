#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "server_config.hpp"
#include "redis_manager.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/fairness_handler.hpp"
#include "handlers/admin_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace fairdraw {

class ConnectionManager;
class RateLimiter;

// Handlers shared by every session; owned by main.
struct RequestHandlers {
    HealthHandler& health;
    FairnessHandler& fairness;
    AdminHandler& admin;
};

/**
 * Extracts {id} from "<prefix>{id}<suffix>" (query string ignored).
 * Returns std::nullopt when the target has another shape or the id is empty.
 */
std::optional<std::string> giveaway_id_from_target(std::string_view target,
                                                   std::string_view prefix,
                                                   std::string_view suffix);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        beast::ssl_stream<beast::tcp_stream>&& stream,
        const ServerConfig& config,
        ConnectionManager& conn_manager,
        RateLimiter& rate_limiter,
        RequestHandlers handlers,
        std::shared_ptr<void> conn_guard
    );

    HttpSession(
        beast::tcp_stream&& stream,
        const ServerConfig& config,
        ConnectionManager& conn_manager,
        RateLimiter& rate_limiter,
        RequestHandlers handlers,
        std::shared_ptr<void> conn_guard
    );

    ~HttpSession() = default;

    void run();

private:
    std::variant<
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    > stream_;
    bool is_tls_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    RateLimiter& rate_limiter_;
    RequestHandlers handlers_;

    std::string remote_addr_;
    std::shared_ptr<void> conn_guard_;

    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);

    bool is_local() const;
    bool rate_limited(const std::string& bucket, int limit, int window_sec);

    http::response<http::string_body> handle_cors_preflight();
    http::response<http::string_body> handle_not_found();
    http::response<http::string_body> handle_unauthorized();
    http::response<http::string_body> handle_rate_limited(const RateLimitResult& res_info);

    template<class Body>
    void add_security_headers(http::response<Body>& res);

    template<class Body>
    void add_cors_headers(http::response<Body>& res);
};

}
