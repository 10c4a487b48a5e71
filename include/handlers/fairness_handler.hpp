#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include "server_config.hpp"
#include "seed_commitment_manager.hpp"
#include "proof_recorder.hpp"

namespace fairdraw {

namespace http = boost::beast::http;

// Unauthenticated public surface: commitment lookup, proof lookup and
// server-side verification of a submitted proof.
class FairnessHandler {
public:
    FairnessHandler(const ServerConfig& config,
                    SeedCommitmentManager& seeds,
                    ProofRecorder& recorder)
        : config_(config)
        , seeds_(seeds)
        , recorder_(recorder) {}

    http::response<http::string_body> handle_commitment(const http::request<http::string_body>& req,
                                                        const std::string& giveaway_id,
                                                        const std::string& remote_addr);

    http::response<http::string_body> handle_proof(const http::request<http::string_body>& req,
                                                   const std::string& giveaway_id,
                                                   const std::string& remote_addr);

    /**
     * Body: {"proof": {...}, "entries": [...]}. With entries the check runs in
     * strong mode, otherwise weak. A well-formed request always yields 200 with
     * the itemised result; only malformed bodies are rejected.
     */
    http::response<http::string_body> handle_verify(const http::request<http::string_body>& req,
                                                    const std::string& remote_addr);

private:
    const ServerConfig& config_;
    SeedCommitmentManager& seeds_;
    ProofRecorder& recorder_;
};

}
