#include "validation/invariants.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include "core/format.hpp"
#include "core/math.hpp"
#include "risk/partition.hpp"

namespace pmatrix::validation {
namespace {

using model::RuntimeStateRecord;

InvariantResult make_result(const std::string_view id, const bool passed, std::string detail) {
  return InvariantResult{id, passed, std::move(detail)};
}

// --- Range ---

InvariantResult check_r1(const RuntimeStateRecord& record) {
  const auto& f = record.functions;
  const bool ok = core::in_unit_interval(f.baseline) && core::in_unit_interval(f.norm) &&
                  core::in_unit_interval(f.stability) && core::in_unit_interval(f.meta_control);
  if (ok) {
    return make_result("INV-R1", true, "all function values in [0.0, 1.0]");
  }

  std::ostringstream detail;
  detail << "function value(s) outside [0.0, 1.0]: baseline=" << core::format_double(f.baseline)
         << ", norm=" << core::format_double(f.norm) << ", stability=" << core::format_double(f.stability)
         << ", meta_control=" << core::format_double(f.meta_control);
  return make_result("INV-R1", false, detail.str());
}

InvariantResult check_score(const std::string_view id, const char* name, const double value) {
  std::ostringstream detail;
  detail << name << '=' << core::format_double(value) << ", expected within [0.0, 1.0]";
  return make_result(id, core::in_unit_interval(value), detail.str());
}

InvariantResult check_r4(const RuntimeStateRecord& record) {
  return make_result("INV-R4", record.timestamp > 0,
                     "timestamp=" + std::to_string(record.timestamp) + ", expected > 0");
}

// --- Consistency ---

bool c1_holds(const RuntimeStateRecord& record) noexcept {
  const auto expected = risk::map_risk_to_mode(record.risk_score);
  return expected.has_value() && *expected == record.mode;
}

bool c2_holds(const RuntimeStateRecord& record) noexcept {
  return risk::map_mode_to_level(record.mode) == record.risk_level;
}

InvariantResult check_c1(const RuntimeStateRecord& record) {
  const auto expected = risk::map_risk_to_mode(record.risk_score);

  std::ostringstream detail;
  detail << "risk_score=" << core::format_double(record.risk_score) << " -> expected mode="
         << (expected.has_value() ? model::to_string(*expected) : std::string_view("<unmappable>"))
         << ", actual mode=" << model::to_string(record.mode);
  return make_result("INV-C1", c1_holds(record), detail.str());
}

InvariantResult check_c2(const RuntimeStateRecord& record) {
  const auto expected = risk::map_mode_to_level(record.mode);

  std::ostringstream detail;
  detail << "mode=" << model::to_string(record.mode) << " -> expected risk_level=" << model::to_string(expected)
         << ", actual risk_level=" << model::to_string(record.risk_level);
  return make_result("INV-C2", c2_holds(record), detail.str());
}

// C3 has no independent predicate: it is exactly C1 and C2.
InvariantResult check_c3(const RuntimeStateRecord& record) {
  if (c1_holds(record) && c2_holds(record)) {
    return make_result("INV-C3", true, "mode and risk_level are determined by risk_score");
  }
  return make_result("INV-C3", false, "mode/risk_level not determined by risk_score (INV-C1 or INV-C2 failed)");
}

// --- Structural ---

InvariantResult check_s1(const RuntimeStateRecord& record) {
  std::vector<std::string_view> empty_fields;
  if (record.spec_version.empty()) {
    empty_fields.emplace_back("spec_version");
  }
  if (record.schema_version.empty()) {
    empty_fields.emplace_back("schema_version");
  }
  if (model::to_string(record.mode).empty()) {
    empty_fields.emplace_back("mode");
  }
  if (model::to_string(record.risk_level).empty()) {
    empty_fields.emplace_back("risk_level");
  }

  if (empty_fields.empty()) {
    return make_result("INV-S1", true, "all eight required fields present and non-empty");
  }

  std::string detail = "empty string field(s):";
  for (const auto field : empty_fields) {
    detail.append(" ").append(field);
  }
  return make_result("INV-S1", false, detail);
}

// Unknown keys are rejected by the decoder, so a decoded record always has exactly eight fields.
InvariantResult check_s2(const RuntimeStateRecord& /*record*/) {
  return make_result("INV-S2", true, "no additional fields (enforced at decode)");
}

InvariantResult check_s3(const RuntimeStateRecord& record) {
  return make_result("INV-S3", record.spec_version == model::kSpecVersion,
                     "spec_version=" + record.spec_version + ", expected=" + std::string(model::kSpecVersion));
}

// Each component must fit in 32 bits.
bool is_version_component(const std::string& part) {
  if (part.empty()) {
    return false;
  }
  std::uint64_t value = 0;
  for (const char c : part) {
    if (c < '0' || c > '9') {
      return false;
    }
    value = (value * 10) + static_cast<std::uint64_t>(c - '0');
    if (value > std::numeric_limits<std::uint32_t>::max()) {
      return false;
    }
  }
  return true;
}

bool is_semantic_version(const std::string& version) {
  std::vector<std::string> parts;
  std::string current;
  for (const char c : version) {
    if (c == '.') {
      parts.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  parts.push_back(current);

  return parts.size() == 3 && std::all_of(parts.begin(), parts.end(), is_version_component);
}

InvariantResult check_s4(const RuntimeStateRecord& record) {
  return make_result("INV-S4", is_semantic_version(record.schema_version),
                     "schema_version=" + record.schema_version + ", expected MAJOR.MINOR.PATCH");
}

// --- Temporal ---

InvariantResult check_t1_note() {
  return make_result("INV-T1", true,
                     "stream-level invariant, not checkable on a single record; use validate_stream_t1()");
}

}  // namespace

std::vector<InvariantResult> validate_all(const model::RuntimeStateRecord& record) {
  std::vector<InvariantResult> results;
  results.reserve(kInvariantCount);

  results.push_back(check_r1(record));
  results.push_back(check_score("INV-R2", "stability_score", record.stability_score));
  results.push_back(check_score("INV-R3", "risk_score", record.risk_score));
  results.push_back(check_r4(record));
  results.push_back(check_c1(record));
  results.push_back(check_c2(record));
  results.push_back(check_c3(record));
  results.push_back(check_s1(record));
  results.push_back(check_s2(record));
  results.push_back(check_s3(record));
  results.push_back(check_s4(record));
  results.push_back(check_t1_note());

  return results;
}

bool is_valid(const model::RuntimeStateRecord& record) {
  const auto results = validate_all(record);
  return std::all_of(results.begin(), results.end(), [](const InvariantResult& r) { return r.passed; });
}

std::optional<std::size_t> validate_stream_t1(const std::vector<model::RuntimeStateRecord>& records) noexcept {
  for (std::size_t i = 1; i < records.size(); ++i) {
    if (records[i].timestamp < records[i - 1].timestamp) {
      return i;
    }
  }
  return std::nullopt;
}

StreamReport validate_stream(const std::vector<model::RuntimeStateRecord>& records) {
  StreamReport report{};
  report.record_count = records.size();
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (!is_valid(records[i])) {
      report.nonconforming_records.push_back(i);
    }
  }
  report.t1_violation = validate_stream_t1(records);
  return report;
}

}  // namespace pmatrix::validation
