#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <cstdlib>

#include "server_config.hpp"
#include "connection_manager.hpp"
#include "redis_manager.hpp"
#include "memory_store.hpp"
#include "random_source.hpp"
#include "seed_commitment_manager.hpp"
#include "winner_selector.hpp"
#include "proof_recorder.hpp"
#include "draw_coordinator.hpp"
#include "http_session.hpp"
#include "rate_limiter.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace fairdraw {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        ConnectionManager& conn_manager,
        RateLimiter& rate_limiter,
        RequestHandlers handlers
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , conn_manager_(conn_manager)
        , rate_limiter_(rate_limiter)
        , handlers_(handlers)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    RateLimiter& rate_limiter_;
    RequestHandlers handlers_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED, "internal", "Accept error: " + ec.message());
        } else {
            beast::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            std::string remote_ip = ep_ec ? "unknown" : ep.address().to_string();

            if (conn_manager_.connection_count() >= config_.max_global_connections) {
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                                  remote_ip, "Global connection limit reached");
                MetricsRegistry::instance().increment_counter("global_limit_rejected");
            } else if (!conn_manager_.increment_ip_count(remote_ip, config_.max_connections_per_ip)) {
                // Enforce per-IP connection limit BEFORE creating session
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                                  remote_ip, "Per-IP connection limit reached");
                MetricsRegistry::instance().increment_counter("ip_limit_rejected");
            } else {
                // Releases the per-IP slot when the session is destroyed
                auto guard = std::shared_ptr<void>(nullptr, [self_ref = shared_from_this(), remote_ip](void*){
                    self_ref->conn_manager_.decrement_ip_count(remote_ip);
                });

                if (config_.enable_tls) {
                    auto stream = beast::ssl_stream<beast::tcp_stream>(
                        beast::tcp_stream(std::move(socket)),
                        ssl_ctx_
                    );

                    std::make_shared<HttpSession>(
                        std::move(stream),
                        config_,
                        conn_manager_,
                        rate_limiter_,
                        handlers_,
                        guard
                    )->run();
                } else {
                    std::make_shared<HttpSession>(
                        beast::tcp_stream(std::move(socket)),
                        config_,
                        conn_manager_,
                        rate_limiter_,
                        handlers_,
                        guard
                    )->run();
                }
            }
        }

        do_accept();
    }
};

}

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [port] [options]\n"
              << "Options:\n"
              << "  --no-tls, -n     Disable TLS (for local development)\n"
              << "  --tls            Enable TLS using FAIRDRAW_CERT_PATH / FAIRDRAW_KEY_PATH\n"
              << "  --memory         Keep fairness records in process memory instead of Redis\n"
              << "  --winner-only    Record winner-only proofs\n"
              << "  --help, -h       Show this help\n"
              << "Environment: FAIRDRAW_PORT, FAIRDRAW_ADDR, FAIRDRAW_REDIS_URL, FAIRDRAW_SECRET_SALT,\n"
              << "             FAIRDRAW_ADMIN_TOKEN, FAIRDRAW_STORAGE, FAIRDRAW_DISCLOSURE, ...\n";
}

int main(int argc, char* argv[]) {
    using fairdraw::SecurityLogger;
    try {
        fairdraw::ServerConfig config;

        // --- Environment Variable Overrides ---
        fairdraw::apply_env_overrides(config);

        // --- CLI Argument Parsing (wins over environment) ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else if (arg == "--tls") {
                config.enable_tls = true;
            } else if (arg == "--memory") {
                config.storage = fairdraw::StorageBackend::MEMORY;
            } else if (arg == "--winner-only") {
                config.disclosure = fairdraw::DisclosureMode::WINNER_ONLY;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                try {
                    config.port = static_cast<uint16_t>(std::stoi(arg));
                } catch (const std::exception&) {
                    std::cerr << "[!] Unknown argument: " << arg << "\n";
                    print_usage(argv[0]);
                    return 1;
                }
            }
        }

        if (config.allowed_origins.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal", "No CORS origins configured");
        }

        if (config.secret_salt == fairdraw::DEFAULT_SECRET_SALT) {
            std::cerr << "CRITICAL SECURITY ERROR: DEFAULT SECRET SALT DETECTED\n";
            std::cerr << "Set 'FAIRDRAW_SECRET_SALT' environment variable immediately!\n";
            return 1;
        }

        if (config.admin_token.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "FAIRDRAW_ADMIN_TOKEN not set; commit and draw endpoints are disabled");
        }

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        if (config.enable_tls) {
            std::filesystem::path exe_path;
            try {
                exe_path = std::filesystem::canonical("/proc/self/exe").parent_path();
            } catch (const std::exception& e) {
                std::cerr << "[!] Warning: Could not detect executable path via /proc/self/exe: " << e.what() << std::endl;
                exe_path = std::filesystem::current_path();
            }

            if (config.cert_path.rfind("certs/", 0) == 0) {
                config.cert_path = (exe_path / config.cert_path).string();
                config.key_path = (exe_path / config.key_path).string();
            }

            if (!std::filesystem::exists(config.cert_path) ||
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n"
                          << "[*] Or use --no-tls for development without TLS.\n";
                return 1;
            }
        }

        std::cout << "FAIRDRAW VERIFIABLE DRAW SERVER v1.0\n"
                  << (config.enable_tls ? "  TLS 1.2+/1.3 encrypted transport\n"
                                        : "  TLS DISABLED (development mode)\n")
                  << "  storage: " << (config.storage == fairdraw::StorageBackend::REDIS ? "redis" : "memory")
                  << ", disclosure: " << (config.disclosure == fairdraw::DisclosureMode::FULL ? "full" : "winner_only")
                  << "\n\n";

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        fairdraw::ConnectionManager conn_manager(config.secret_salt);

        // --- Storage backend ---
        std::unique_ptr<fairdraw::RedisManager> redis;
        std::unique_ptr<fairdraw::MemoryStore> memory;
        fairdraw::FairnessStore* store = nullptr;
        fairdraw::GiveawayFinalizer* finalizer = nullptr;

        if (config.storage == fairdraw::StorageBackend::REDIS) {
            redis = std::make_unique<fairdraw::RedisManager>(config);
            if (!redis->is_connected()) {
                std::cerr << "[!] Redis unavailable at startup; fairness operations will fail until it recovers.\n";
            }
            store = redis.get();
            finalizer = redis.get();
        } else {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "Memory storage selected; records are lost on exit");
            memory = std::make_unique<fairdraw::MemoryStore>();
            store = memory.get();
            finalizer = memory.get();
        }

        fairdraw::RateLimiter rate_limiter(redis.get());

        // --- Fairness engine ---
        fairdraw::OpenSslRandomSource random;
        fairdraw::SeedCommitmentManager seeds(*store, random);

        fairdraw::WinnerSelector::Options selector_options;
        selector_options.parallel_threshold = config.selection_parallel_threshold;
        selector_options.worker_threads = static_cast<unsigned>(config.selection_worker_threads);
        fairdraw::WinnerSelector selector(selector_options);

        fairdraw::ProofRecorder recorder(*store, finalizer, config.disclosure);
        fairdraw::DrawCoordinator coordinator(*store, seeds, selector, recorder);

        fairdraw::HealthHandler health_handler(config, conn_manager, redis.get());
        fairdraw::FairnessHandler fairness_handler(config, seeds, recorder);
        fairdraw::AdminHandler admin_handler(config, seeds, coordinator);
        fairdraw::RequestHandlers handlers{health_handler, fairness_handler, admin_handler};

        auto listener = std::make_shared<fairdraw::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            conn_manager,
            rate_limiter,
            handlers
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Listening on " + config.address + ":" + std::to_string(config.port));

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal", "Initiating graceful shutdown");
                listener->stop();
                ioc.stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
