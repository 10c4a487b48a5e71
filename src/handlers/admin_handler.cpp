#include "handlers/admin_handler.hpp"
#include "handlers/response_builder.hpp"
#include <optional>
#include <stdexcept>
#include "input_validator.hpp"
#include "proof_codec.hpp"
#include "security_logger.hpp"

namespace json = boost::json;

namespace fairdraw {

namespace {

std::string required_identifier(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string()) {
        throw std::invalid_argument(std::string("missing ") + key);
    }
    std::string value(it->value().as_string());
    if (!InputValidator::is_valid_identifier(value)) {
        throw std::invalid_argument(std::string("invalid ") + key);
    }
    return value;
}

std::optional<Timestamp> optional_timestamp(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return std::nullopt;
    if (it->value().is_int64()) return from_unix_seconds(it->value().as_int64());
    if (it->value().is_uint64()) return from_unix_seconds(static_cast<int64_t>(it->value().as_uint64()));
    throw std::invalid_argument(std::string("non-integer ") + key);
}

}

http::response<http::string_body> AdminHandler::reject(const http::request<http::string_body>& req,
                                                       const std::string& remote_addr,
                                                       const FairnessError& e) {
    auto event = SecurityLogger::EventType::SEQUENCE_VIOLATION;
    if (e.category() == ErrorCategory::INTEGRITY) event = SecurityLogger::EventType::INTEGRITY_FAILURE;
    if (e.category() == ErrorCategory::INFRASTRUCTURE) event = SecurityLogger::EventType::STORAGE_FAILURE;
    SecurityLogger::log(SecurityLogger::Level::WARNING, event, remote_addr, e.what());
    return fairness_error_response(e, req.version());
}

http::response<http::string_body> AdminHandler::handle_commit(const http::request<http::string_body>& req,
                                                              const std::string& remote_addr) {
    std::string giveaway_id;
    std::string creator_id;
    Timestamp entries_close_at;

    try {
        auto body = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
        if (!body.is_object()) throw std::invalid_argument("body must be a JSON object");
        const auto& obj = body.as_object();

        giveaway_id = required_identifier(obj, "giveaway_id");
        auto close = optional_timestamp(obj, "entries_close_at");
        if (!close) throw std::invalid_argument("missing entries_close_at");
        entries_close_at = *close;
        if (obj.contains("creator_id")) {
            creator_id = required_identifier(obj, "creator_id");
        }
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, std::string("Commit: ") + e.what());
        return error_response(http::status::bad_request, req.version(), "Invalid request format");
    }

    try {
        SeedCommitment record = seeds_.commit(giveaway_id, entries_close_at, creator_id);
        return json_response(http::status::created, req.version(), codec::to_json(record, false));
    } catch (const FairnessError& e) {
        return reject(req, remote_addr, e);
    }
}

http::response<http::string_body> AdminHandler::handle_draw(const http::request<http::string_body>& req,
                                                            const std::string& remote_addr) {
    std::string giveaway_id;
    std::optional<Timestamp> entries_close_at;
    std::vector<Entry> entries;

    try {
        auto body = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
        if (!body.is_object()) throw std::invalid_argument("body must be a JSON object");
        const auto& obj = body.as_object();

        giveaway_id = required_identifier(obj, "giveaway_id");
        entries_close_at = optional_timestamp(obj, "entries_close_at");

        auto entries_it = obj.find("entries");
        if (entries_it == obj.end()) throw std::invalid_argument("missing entries");
        if (entries_it->value().is_array() &&
            entries_it->value().as_array().size() > config_.max_entries_per_draw) {
            return error_response(http::status::payload_too_large, req.version(), "Too many entries");
        }
        entries = codec::entries_from_json(entries_it->value());
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, std::string("Draw: ") + e.what());
        return error_response(http::status::bad_request, req.version(), "Invalid request format");
    }

    try {
        if (!entries_close_at) {
            auto record = seeds_.public_commitment(giveaway_id);
            if (!record) throw FairnessError(ErrorCode::NOT_COMMITTED, giveaway_id);
            entries_close_at = record->entries_close_at;
        }

        FairnessProof proof = coordinator_.run_draw(giveaway_id, *entries_close_at, entries);
        return json_response(http::status::ok, req.version(), codec::to_json(proof));
    } catch (const FairnessError& e) {
        return reject(req, remote_addr, e);
    }
}

http::response<http::string_body> AdminHandler::handle_state(const http::request<http::string_body>& req,
                                                             const std::string& giveaway_id) {
    if (!InputValidator::is_valid_identifier(giveaway_id)) {
        return error_response(http::status::bad_request, req.version(), "Invalid giveaway id");
    }

    try {
        json::object response;
        response["giveaway_id"] = giveaway_id;
        response["state"] = lifecycle_state_name(coordinator_.lifecycle_state(giveaway_id));
        return json_response(http::status::ok, req.version(), response);
    } catch (const FairnessError& e) {
        return fairness_error_response(e, req.version());
    }
}

}
