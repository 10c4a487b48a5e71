#include "proof_codec.hpp"

#include <stdexcept>

#include "crypto.hpp"

namespace json = boost::json;

namespace fairdraw {
namespace codec {

namespace {

const json::object& as_object(const json::value& value, const char* what) {
    if (!value.is_object()) {
        throw std::invalid_argument(std::string(what) + " must be a JSON object");
    }
    return value.as_object();
}

std::string get_string(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string()) {
        throw std::invalid_argument(std::string("missing or non-string field: ") + key);
    }
    return std::string(it->value().as_string());
}

std::string get_optional_string(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return "";
    if (!it->value().is_string()) {
        throw std::invalid_argument(std::string("non-string field: ") + key);
    }
    return std::string(it->value().as_string());
}

uint64_t get_uint(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end()) {
        const auto& v = it->value();
        if (v.is_uint64()) return v.as_uint64();
        if (v.is_int64() && v.as_int64() >= 0) return static_cast<uint64_t>(v.as_int64());
    }
    throw std::invalid_argument(std::string("missing or non-negative integer field: ") + key);
}

int64_t get_int(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end()) {
        const auto& v = it->value();
        if (v.is_int64()) return v.as_int64();
        if (v.is_uint64()) return static_cast<int64_t>(v.as_uint64());
    }
    throw std::invalid_argument(std::string("missing or non-integer field: ") + key);
}

bool get_bool(const json::object& obj, const char* key, bool fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->value().is_bool()) {
        throw std::invalid_argument(std::string("non-boolean field: ") + key);
    }
    return it->value().as_bool();
}

SelectionRecord record_from_json(const json::value& value) {
    const auto& obj = as_object(value, "selection record");
    SelectionRecord rec;
    rec.entry_id = get_string(obj, "entry_id");
    rec.deterministic_input = get_string(obj, "deterministic_input");
    rec.keyed_value = get_string(obj, "keyed_value");
    rec.ordinal = get_uint(obj, "ordinal");
    return rec;
}

}

json::object to_json(const SeedCommitment& record, bool include_seed) {
    json::object obj;
    obj["giveaway_id"] = record.giveaway_id;
    obj["creator_id"] = record.creator_id;
    obj["commitment"] = record.commitment;
    obj["committed_at"] = to_unix_seconds(record.committed_at);
    obj["entries_close_at"] = to_unix_seconds(record.entries_close_at);
    obj["revealed"] = record.revealed;
    if (record.revealed_at) {
        obj["revealed_at"] = to_unix_seconds(*record.revealed_at);
    } else {
        obj["revealed_at"] = nullptr;
    }
    if (include_seed && !record.seed.empty()) {
        obj["seed"] = crypto::to_hex(record.seed);
    }
    return obj;
}

SeedCommitment commitment_from_json(const json::value& value) {
    const auto& obj = as_object(value, "seed commitment");
    SeedCommitment record;
    record.giveaway_id = get_string(obj, "giveaway_id");
    record.creator_id = get_optional_string(obj, "creator_id");
    record.commitment = get_string(obj, "commitment");
    record.committed_at = from_unix_seconds(get_int(obj, "committed_at"));
    record.entries_close_at = from_unix_seconds(get_int(obj, "entries_close_at"));
    record.revealed = get_bool(obj, "revealed", false);

    auto revealed_at = obj.find("revealed_at");
    if (revealed_at != obj.end() && !revealed_at->value().is_null()) {
        record.revealed_at = from_unix_seconds(get_int(obj, "revealed_at"));
    }

    std::string seed_hex = get_optional_string(obj, "seed");
    if (!seed_hex.empty()) {
        auto seed = crypto::from_hex(seed_hex);
        if (!seed) {
            throw std::invalid_argument("seed is not valid hex");
        }
        record.seed = std::move(*seed);
    }
    return record;
}

std::string calculation_line(const SelectionRecord& record) {
    return "HMAC_SHA256(seed, \"" + record.deterministic_input + "\") = " + record.keyed_value;
}

json::object to_json(const SelectionRecord& record) {
    json::object obj;
    obj["entry_id"] = record.entry_id;
    obj["deterministic_input"] = record.deterministic_input;
    obj["keyed_value"] = record.keyed_value;
    obj["ordinal"] = record.ordinal;
    obj["calculation"] = calculation_line(record);
    return obj;
}

json::object to_json(const FairnessProof& proof) {
    json::object obj;
    obj["giveaway_id"] = proof.giveaway_id;
    obj["winner_entry_id"] = proof.winner_entry_id;
    obj["winner_user_id"] = proof.winner_user_id;
    obj["seed"] = proof.seed;
    obj["commitment"] = proof.commitment;
    obj["total_entries"] = proof.total_entries;
    obj["winner_deterministic_input"] = proof.winner_deterministic_input;
    obj["winner_keyed_value"] = proof.winner_keyed_value;
    obj["selection_rule"] = proof.selection_rule;
    obj["verified_at"] = to_unix_seconds(proof.verified_at);

    if (!proof.records.empty()) {
        json::array records;
        records.reserve(proof.records.size());
        for (const auto& rec : proof.records) {
            records.push_back(to_json(rec));
        }
        obj["records"] = std::move(records);
    }
    return obj;
}

FairnessProof proof_from_json(const json::value& value) {
    const auto& obj = as_object(value, "fairness proof");
    FairnessProof proof;
    proof.giveaway_id = get_string(obj, "giveaway_id");
    proof.winner_entry_id = get_string(obj, "winner_entry_id");
    proof.winner_user_id = get_optional_string(obj, "winner_user_id");
    proof.seed = get_string(obj, "seed");
    proof.commitment = get_string(obj, "commitment");
    proof.total_entries = get_uint(obj, "total_entries");
    proof.winner_deterministic_input = get_string(obj, "winner_deterministic_input");
    proof.winner_keyed_value = get_string(obj, "winner_keyed_value");
    proof.selection_rule = get_string(obj, "selection_rule");
    if (obj.contains("verified_at")) {
        proof.verified_at = from_unix_seconds(get_int(obj, "verified_at"));
    }

    auto records = obj.find("records");
    if (records != obj.end() && !records->value().is_null()) {
        if (!records->value().is_array()) {
            throw std::invalid_argument("records must be an array");
        }
        for (const auto& rec : records->value().as_array()) {
            proof.records.push_back(record_from_json(rec));
        }
    }
    return proof;
}

json::object to_json(const Entry& entry) {
    json::object obj;
    obj["entry_id"] = entry.entry_id;
    obj["deterministic_input"] = entry.deterministic_input;
    obj["user_id"] = entry.user_id;
    return obj;
}

json::array to_json(const std::vector<Entry>& entries) {
    json::array arr;
    arr.reserve(entries.size());
    for (const auto& entry : entries) {
        arr.push_back(to_json(entry));
    }
    return arr;
}

std::vector<Entry> entries_from_json(const json::value& value) {
    if (!value.is_array()) {
        throw std::invalid_argument("entries must be a JSON array");
    }

    std::vector<Entry> entries;
    entries.reserve(value.as_array().size());
    for (const auto& item : value.as_array()) {
        const auto& obj = as_object(item, "entry");
        Entry entry;
        entry.entry_id = get_string(obj, "entry_id");
        // Content-derived input: explicit field, else the payment or order reference.
        entry.deterministic_input = get_optional_string(obj, "deterministic_input");
        if (entry.deterministic_input.empty()) entry.deterministic_input = get_optional_string(obj, "payment_id");
        if (entry.deterministic_input.empty()) entry.deterministic_input = get_optional_string(obj, "order_id");
        entry.user_id = get_optional_string(obj, "user_id");
        entries.push_back(std::move(entry));
    }
    return entries;
}

json::object to_json(const VerificationResult& result) {
    json::object obj;
    obj["valid"] = result.valid;
    obj["mode"] = verification_mode_name(result.mode);
    obj["maximality_checked"] = result.maximality_checked;

    json::array reasons;
    for (auto reason : result.reasons) {
        reasons.push_back(json::value(failure_reason_name(reason)));
    }
    obj["reasons"] = std::move(reasons);

    obj["computed_commitment"] = result.computed_commitment;
    obj["computed_keyed_value"] = result.computed_keyed_value;
    if (result.mode == VerificationMode::STRONG) {
        obj["expected_winner_entry_id"] = result.expected_winner_entry_id;
    }
    return obj;
}

}
}
