#include "handlers/fairness_handler.hpp"
#include "handlers/response_builder.hpp"
#include <optional>
#include <stdexcept>
#include "input_validator.hpp"
#include "metrics.hpp"
#include "proof_codec.hpp"
#include "security_logger.hpp"
#include "verifier.hpp"

namespace json = boost::json;

namespace fairdraw {

http::response<http::string_body> FairnessHandler::handle_commitment(const http::request<http::string_body>& req,
                                                                     const std::string& giveaway_id,
                                                                     const std::string& remote_addr) {
    if (!InputValidator::is_valid_identifier(giveaway_id)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, "Commitment lookup: invalid giveaway id");
        return error_response(http::status::bad_request, req.version(), "Invalid giveaway id");
    }

    try {
        auto record = seeds_.public_commitment(giveaway_id);
        if (!record) {
            return error_response(http::status::not_found, req.version(), "No commitment for giveaway");
        }
        // The seed is only present once revealed.
        return json_response(http::status::ok, req.version(), codec::to_json(*record, true));
    } catch (const FairnessError& e) {
        return fairness_error_response(e, req.version());
    }
}

http::response<http::string_body> FairnessHandler::handle_proof(const http::request<http::string_body>& req,
                                                                const std::string& giveaway_id,
                                                                const std::string& remote_addr) {
    if (!InputValidator::is_valid_identifier(giveaway_id)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, "Proof lookup: invalid giveaway id");
        return error_response(http::status::bad_request, req.version(), "Invalid giveaway id");
    }

    try {
        auto proof = recorder_.proof(giveaway_id);
        if (!proof) {
            return error_response(http::status::not_found, req.version(), "No proof for giveaway");
        }
        return json_response(http::status::ok, req.version(), codec::to_json(*proof));
    } catch (const FairnessError& e) {
        return fairness_error_response(e, req.version());
    }
}

http::response<http::string_body> FairnessHandler::handle_verify(const http::request<http::string_body>& req,
                                                                 const std::string& remote_addr) {
    FairnessProof proof;
    std::optional<std::vector<Entry>> entries;

    try {
        auto body = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
        if (!body.is_object()) {
            throw std::invalid_argument("body must be a JSON object");
        }
        const auto& obj = body.as_object();

        auto proof_it = obj.find("proof");
        if (proof_it == obj.end()) {
            throw std::invalid_argument("missing proof");
        }
        proof = codec::proof_from_json(proof_it->value());

        auto entries_it = obj.find("entries");
        if (entries_it != obj.end() && !entries_it->value().is_null()) {
            entries = codec::entries_from_json(entries_it->value());
            if (entries->size() > config_.max_entries_per_draw) {
                return error_response(http::status::payload_too_large, req.version(), "Too many entries");
            }
        }
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, std::string("Verify: malformed request: ") + e.what());
        return error_response(http::status::bad_request, req.version(), "Invalid request format");
    }

    VerificationResult result = entries ? Verifier::verify(proof, *entries) : Verifier::verify(proof);

    auto& metrics = MetricsRegistry::instance();
    if (result.valid) {
        metrics.increment_counter("verifications_valid_total");
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::PROOF_VERIFIED,
                            remote_addr, "giveaway=" + proof.giveaway_id + " mode=" + verification_mode_name(result.mode));
    } else {
        metrics.increment_counter("verifications_invalid_total");
        std::string reasons;
        for (auto reason : result.reasons) {
            if (!reasons.empty()) reasons += ",";
            reasons += failure_reason_name(reason);
        }
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::VERIFICATION_FAILED,
                            remote_addr, "giveaway=" + proof.giveaway_id + " reasons=" + reasons);
    }

    return json_response(http::status::ok, req.version(), codec::to_json(result));
}

}
