#include "http_session.hpp"
#include "connection_manager.hpp"
#include "rate_limiter.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include "handlers/response_builder.hpp"
#include <boost/json.hpp>
#include <ctime>
#include <iostream>

namespace json = boost::json;

namespace fairdraw {

std::optional<std::string> giveaway_id_from_target(std::string_view target,
                                                   std::string_view prefix,
                                                   std::string_view suffix) {
    auto query = target.find('?');
    if (query != std::string_view::npos) {
        target = target.substr(0, query);
    }
    if (target.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (target.substr(0, prefix.size()) != prefix) return std::nullopt;
    if (target.substr(target.size() - suffix.size()) != suffix) return std::nullopt;

    std::string_view id = target.substr(prefix.size(), target.size() - prefix.size() - suffix.size());
    if (id.empty() || id.find('/') != std::string_view::npos) return std::nullopt;
    return std::string(id);
}

// HTTPS Session state (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    ConnectionManager& conn_manager,
    RateLimiter& rate_limiter,
    RequestHandlers handlers,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , conn_manager_(conn_manager)
    , rate_limiter_(rate_limiter)
    , handlers_(handlers)
    , conn_guard_(std::move(conn_guard))
{
    beast::error_code ec;
    auto& s = std::get<beast::ssl_stream<beast::tcp_stream>>(stream_);
    auto ep = beast::get_lowest_layer(s).socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Plaintext HTTP Session state (usually behind a local proxy or for testing)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    ConnectionManager& conn_manager,
    RateLimiter& rate_limiter,
    RequestHandlers handlers,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , conn_manager_(conn_manager)
    , rate_limiter_(rate_limiter)
    , handlers_(handlers)
    , conn_guard_(std::move(conn_guard))
{
    beast::error_code ec;
    auto& s = std::get<beast::tcp_stream>(stream_);
    auto ep = s.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Starts the asynchronous session activity
void HttpSession::run() {
    if (is_tls_) {
        // Perform SSL/TLS handshake before processing HTTP requests
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure on handshake failure to prevent resource exhaustion from scanners
        return;
    }
    do_read();
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    req_ = {};

    // Enforce connection timeout to prevent slow-loris attacks
    auto timeout = std::chrono::seconds(config_.connection_timeout_sec);
    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).expires_after(timeout);
    } else {
        std::get<beast::tcp_stream>(stream_).expires_after(timeout);
    }

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_request_size);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

// Handles the completion of an asynchronous read operation
void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::body_limit) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr_, "Request body exceeds limit");
        auto res = error_response(http::status::payload_too_large, 11, "Payload too large");
        res.keep_alive(false);
        send_response(std::move(res));
        return;
    }
    if (ec) {
        return;
    }

    req_ = parser_->release();

    // Global token bucket keyed by the blinded client address.
    if (rate_limited("global:", config_.global_rate_limit, 10)) {
        return;
    }

    handle_request();
}

bool HttpSession::is_local() const {
    return remote_addr_ == "127.0.0.1" || remote_addr_ == "::1";
}

bool HttpSession::rate_limited(const std::string& bucket, int limit, int window_sec) {
    auto res = rate_limiter_.check(bucket + conn_manager_.blind_id(remote_addr_), limit, window_sec);
    if (res.allowed) return false;

    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT,
                        remote_addr_, "Bucket " + bucket + " exhausted");
    MetricsRegistry::instance().increment_counter("rate_limited_total");
    send_response(handle_rate_limited(res));
    return true;
}

void HttpSession::handle_request() {
    auto target = std::string_view(req_.target().data(), req_.target().size());
    auto method = req_.method();

    // Handle CORS Preflight
    if (method == http::verb::options) {
        send_response(handle_cors_preflight());
        return;
    }

    // --- Routing Table ---

    // Health Checks & Metrics
    if (target == "/health" && method == http::verb::get) {
        send_response(handlers_.health.handle_health(req_.version()));
        return;
    }
    if ((target == "/stats" || target == "/metrics") && method == http::verb::get) {
        if (!is_local() && !handlers_.health.verify_admin_request(req_)) {
            send_response(handle_not_found());
        } else if (target == "/stats") {
            send_response(handlers_.health.handle_stats(req_));
        } else {
            send_response(handlers_.health.handle_metrics(req_.version()));
        }
        return;
    }

    // Public fairness surface
    if (method == http::verb::get) {
        if (auto id = giveaway_id_from_target(target, "/v1/giveaways/", "/commitment")) {
            if (!rate_limited("commitment:", config_.commitment_read_limit, 60)) {
                send_response(handlers_.fairness.handle_commitment(req_, *id, remote_addr_));
            }
            return;
        }
        if (auto id = giveaway_id_from_target(target, "/v1/giveaways/", "/proof")) {
            if (!rate_limited("proof:", config_.proof_read_limit, 60)) {
                send_response(handlers_.fairness.handle_proof(req_, *id, remote_addr_));
            }
            return;
        }
    }
    if (target == "/v1/verify" && method == http::verb::post) {
        if (!rate_limited("verify:", config_.verify_limit, 60)) {
            send_response(handlers_.fairness.handle_verify(req_, remote_addr_));
        }
        return;
    }

    // Operator lifecycle endpoints
    if (target.substr(0, 10) == "/v1/admin/") {
        if (rate_limited("admin:", config_.admin_limit, 60)) {
            return;
        }
        if (!handlers_.health.verify_admin_request(req_)) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                                remote_addr_, "Admin request rejected: missing or invalid token");
            send_response(handle_unauthorized());
            return;
        }

        if (target == "/v1/admin/commit" && method == http::verb::post) {
            send_response(handlers_.admin.handle_commit(req_, remote_addr_));
        } else if (target == "/v1/admin/draw" && method == http::verb::post) {
            send_response(handlers_.admin.handle_draw(req_, remote_addr_));
        } else if (method == http::verb::get) {
            if (auto id = giveaway_id_from_target(target, "/v1/admin/giveaways/", "/state")) {
                send_response(handlers_.admin.handle_state(req_, *id));
            } else {
                send_response(handle_not_found());
            }
        } else {
            send_response(handle_not_found());
        }
        return;
    }

    send_response(handle_not_found());
}

http::response<http::string_body> HttpSession::handle_cors_preflight() {
    http::response<http::string_body> res{http::status::no_content, req_.version()};
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpSession::handle_not_found() {
    return error_response(http::status::not_found, req_.version(), "Not Found");
}

http::response<http::string_body> HttpSession::handle_unauthorized() {
    return error_response(http::status::unauthorized, req_.version(), "Unauthorized");
}

http::response<http::string_body> HttpSession::handle_rate_limited(const RateLimitResult& res_info) {
    json::object response;
    response["error"] = "Rate limit exceeded";
    response["retry_after"] = res_info.reset_after_sec;
    response["limit"] = res_info.limit;

    auto res = json_response(http::status::too_many_requests, req_.version(), response);
    res.set(http::field::retry_after, std::to_string(res_info.reset_after_sec));
    res.set("X-RateLimit-Limit", std::to_string(res_info.limit));
    res.set("X-RateLimit-Remaining", "0");
    res.set("X-RateLimit-Reset", std::to_string(std::time(nullptr) + res_info.reset_after_sec));

    if (res_info.reset_after_sec >= 60) {
        res.keep_alive(false);
    }
    return res;
}

template<class Body>
void HttpSession::add_security_headers(http::response<Body>& res) {
    res.set(http::field::server, "FairDraw/1.0");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Referrer-Policy", "strict-origin-when-cross-origin");
    res.set("Content-Security-Policy", "default-src 'none'; frame-ancestors 'none'");
    if (config_.enable_tls) {
        res.set("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
    }
}

template<class Body>
void HttpSession::add_cors_headers(http::response<Body>& res) {
    std::string origin;
    auto origin_it = req_.find(http::field::origin);
    if (origin_it != req_.end()) {
        origin = std::string(origin_it->value());
    }

    if (!origin.empty()) {
        bool origin_allowed = false;
        for (const auto& allowed : config_.allowed_origins) {
            if (allowed == "*" || allowed == origin) {
                origin_allowed = true;
                break;
            }
        }
        if (origin_allowed) {
            res.set(http::field::access_control_allow_origin, origin);
        } else {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                                remote_addr_, "Disallowed origin: " + origin);
        }
    }

    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type,X-Admin-Token");
    res.set(http::field::access_control_max_age, "86400");
    res.set(http::field::vary, "Origin");
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    add_security_headers(res);
    add_cors_headers(res);
    if (!req_.keep_alive()) {
        res.keep_alive(false);
    }

    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    auto self = shared_from_this();

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        std::cerr << "[!] HTTP write error: " << ec.message() << "\n";
        return;
    }

    if (close) {
        if (is_tls_) {
            beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        } else {
            std::get<beast::tcp_stream>(stream_).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        }
        return;
    }

    do_read();
}

}
