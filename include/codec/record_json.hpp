#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/runtime_state.hpp"

namespace pmatrix::codec {

nlohmann::json encode_record(const model::RuntimeStateRecord& record);

// indent < 0 produces the compact single-line form.
std::string dump_record(const model::RuntimeStateRecord& record, int indent = 2);

// Strict decode: exactly the eight canonical keys (and four inside "functions"),
// correct JSON types, canonical mode/risk_level names. Throws core::DecodeError.
model::RuntimeStateRecord decode_record(const nlohmann::json& document);

model::RuntimeStateRecord parse_record(std::string_view text);

// Newline-delimited records in emission order; blank lines are skipped.
std::vector<model::RuntimeStateRecord> parse_record_lines(std::string_view text);

}  // namespace pmatrix::codec
