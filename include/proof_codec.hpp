#pragma once

#include <string>
#include <vector>
#include <boost/json.hpp>

#include "fairness_types.hpp"

namespace fairdraw {

// JSON wire/storage format for the fairness records. Parsers throw
// std::invalid_argument when a required field is missing or has the wrong type.
namespace codec {

boost::json::object to_json(const SeedCommitment& record, bool include_seed);
SeedCommitment commitment_from_json(const boost::json::value& value);

boost::json::object to_json(const SelectionRecord& record);
boost::json::object to_json(const FairnessProof& proof);
FairnessProof proof_from_json(const boost::json::value& value);

boost::json::object to_json(const Entry& entry);
boost::json::array to_json(const std::vector<Entry>& entries);
std::vector<Entry> entries_from_json(const boost::json::value& value);

boost::json::object to_json(const VerificationResult& result);

// Human-readable line stored beside each disclosed keyed value.
std::string calculation_line(const SelectionRecord& record);

}

}
