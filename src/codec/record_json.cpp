#include "codec/record_json.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <string>

#include "core/errors.hpp"

namespace pmatrix::codec {
namespace {

template <std::size_t N>
void require_exact_keys(const nlohmann::json& object, const std::array<std::string_view, N>& expected,
                        const char* where) {
  if (!object.is_object()) {
    throw core::DecodeError(std::string(where) + " must be a JSON object");
  }

  for (const auto& item : object.items()) {
    if (std::find(expected.begin(), expected.end(), item.key()) == expected.end()) {
      throw core::DecodeError("unknown field \"" + item.key() + "\" in " + where);
    }
  }

  for (const auto key : expected) {
    if (object.find(std::string(key)) == object.end()) {
      throw core::DecodeError("missing field \"" + std::string(key) + "\" in " + where);
    }
  }
}

const nlohmann::json& field(const nlohmann::json& object, const char* key) {
  return object.at(key);
}

double read_number(const nlohmann::json& object, const char* key) {
  const auto& value = field(object, key);
  if (!value.is_number()) {
    throw core::DecodeError(std::string(key) + " must be a number");
  }
  return value.get<double>();
}

std::string read_string(const nlohmann::json& object, const char* key) {
  const auto& value = field(object, key);
  if (!value.is_string()) {
    throw core::DecodeError(std::string(key) + " must be a string");
  }
  return value.get<std::string>();
}

std::uint64_t read_timestamp(const nlohmann::json& object) {
  const auto& value = field(object, "timestamp");
  // Values built from a signed C++ integer are stored as number_integer.
  if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<std::int64_t>() < 0)) {
    throw core::DecodeError("timestamp must be a non-negative integer");
  }
  return value.get<std::uint64_t>();
}

}  // namespace

nlohmann::json encode_record(const model::RuntimeStateRecord& record) {
  const auto& f = record.functions;
  return nlohmann::json{
      {"spec_version", record.spec_version},
      {"schema_version", record.schema_version},
      {"timestamp", record.timestamp},
      {"functions",
       {{"baseline", f.baseline}, {"norm", f.norm}, {"stability", f.stability}, {"meta_control", f.meta_control}}},
      {"stability_score", record.stability_score},
      {"risk_score", record.risk_score},
      {"mode", std::string(model::to_string(record.mode))},
      {"risk_level", std::string(model::to_string(record.risk_level))},
  };
}

std::string dump_record(const model::RuntimeStateRecord& record, const int indent) {
  return encode_record(record).dump(indent);
}

model::RuntimeStateRecord decode_record(const nlohmann::json& document) {
  require_exact_keys(document, model::kRecordFields, "record");
  const auto& functions = field(document, "functions");
  require_exact_keys(functions, model::kFunctionFields, "functions");

  model::RuntimeStateRecord record{};
  record.spec_version = read_string(document, "spec_version");
  record.schema_version = read_string(document, "schema_version");
  record.timestamp = read_timestamp(document);
  record.functions.baseline = read_number(functions, "baseline");
  record.functions.norm = read_number(functions, "norm");
  record.functions.stability = read_number(functions, "stability");
  record.functions.meta_control = read_number(functions, "meta_control");
  record.stability_score = read_number(document, "stability_score");
  record.risk_score = read_number(document, "risk_score");

  const auto mode_name = read_string(document, "mode");
  const auto mode = model::parse_mode(mode_name);
  if (!mode.has_value()) {
    throw core::DecodeError("mode \"" + mode_name + "\" is not one of Optimal, Normal, Caution, Alert, Halt");
  }
  record.mode = *mode;

  const auto level_name = read_string(document, "risk_level");
  const auto level = model::parse_risk_level(level_name);
  if (!level.has_value()) {
    throw core::DecodeError("risk_level \"" + level_name + "\" is not one of L1, L2, L3, L4, L5");
  }
  record.risk_level = *level;

  return record;
}

model::RuntimeStateRecord parse_record(const std::string_view text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& ex) {
    throw core::DecodeError(std::string("malformed JSON: ") + ex.what());
  }
  return decode_record(document);
}

std::vector<model::RuntimeStateRecord> parse_record_lines(const std::string_view text) {
  std::vector<model::RuntimeStateRecord> records;

  std::size_t line_number = 0;
  std::size_t begin = 0;
  while (begin <= text.size()) {
    auto end = text.find('\n', begin);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    ++line_number;

    const auto line = text.substr(begin, end - begin);
    const bool blank = std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    if (!blank) {
      try {
        records.push_back(parse_record(line));
      } catch (const core::DecodeError& ex) {
        throw core::DecodeError("line " + std::to_string(line_number) + ": " + ex.what());
      }
    }

    begin = end + 1;
  }

  return records;
}

}  // namespace pmatrix::codec
