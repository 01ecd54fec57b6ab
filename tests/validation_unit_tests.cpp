#include <cstddef>
#include <iostream>
#include <limits>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "model/runtime_state.hpp"
#include "validation/invariants.hpp"

using pmatrix::model::Functions;
using pmatrix::model::RuntimeStateRecord;
using pmatrix::model::operating_mode;
using pmatrix::model::risk_class;
using pmatrix::validation::InvariantResult;
using pmatrix::validation::is_valid;
using pmatrix::validation::kInvariantCount;
using pmatrix::validation::validate_all;
using pmatrix::validation::validate_stream;
using pmatrix::validation::validate_stream_t1;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

RuntimeStateRecord make_record(const Functions& functions, const double stability_score, const double risk_score,
                               const operating_mode mode, const risk_class level, const std::uint64_t timestamp) {
  RuntimeStateRecord record{};
  record.timestamp = timestamp;
  record.functions = functions;
  record.stability_score = stability_score;
  record.risk_score = risk_score;
  record.mode = mode;
  record.risk_level = level;
  return record;
}

// Scores are deliberately not the mean of the functions: no formula is enforced.
RuntimeStateRecord reference_record() {
  return make_record(Functions{0.25, 0.70, 0.30, 0.20}, 0.58, 0.42, operating_mode::Caution, risk_class::L3,
                     1707500000);
}

std::set<std::string_view> failed_ids(const RuntimeStateRecord& record) {
  std::set<std::string_view> failed;
  for (const auto& result : validate_all(record)) {
    if (!result.passed) {
      failed.insert(result.id);
    }
  }
  return failed;
}

int test_reference_record_conforms() {
  const auto results = validate_all(reference_record());
  if (results.size() != kInvariantCount) {
    return fail("test_reference_record_conforms", "expected twelve results");
  }

  const char* expected_order[] = {"INV-R1", "INV-R2", "INV-R3", "INV-R4", "INV-C1", "INV-C2",
                                  "INV-C3", "INV-S1", "INV-S2", "INV-S3", "INV-S4", "INV-T1"};
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (results[i].id != expected_order[i]) {
      return fail("test_reference_record_conforms", "results out of canonical order");
    }
    if (!results[i].passed) {
      return fail("test_reference_record_conforms", "reference record should pass every invariant");
    }
    if (results[i].detail.empty()) {
      return fail("test_reference_record_conforms", "every result carries a detail");
    }
  }

  if (!is_valid(reference_record())) {
    return fail("test_reference_record_conforms", "is_valid should be true");
  }
  return 0;
}

int test_boundary_records_conform() {
  const auto optimal = make_record(Functions{1.0, 1.0, 1.0, 1.0}, 1.0, 0.0, operating_mode::Optimal, risk_class::L1, 1000);
  const auto normal = make_record(Functions{0.5, 0.5, 0.5, 0.5}, 0.8, 0.2, operating_mode::Normal, risk_class::L2, 1000);
  const auto halt = make_record(Functions{0.0, 0.0, 0.0, 0.0}, 0.0, 1.0, operating_mode::Halt, risk_class::L5, 1000);
  if (!is_valid(optimal) || !is_valid(normal) || !is_valid(halt)) {
    return fail("test_boundary_records_conform", "band-edge records should conform");
  }
  return 0;
}

int test_zero_timestamp_fails_only_r4() {
  auto record = reference_record();
  record.timestamp = 0;
  if (failed_ids(record) != std::set<std::string_view>{"INV-R4"}) {
    return fail("test_zero_timestamp_fails_only_r4", "only INV-R4 should fail");
  }
  if (is_valid(record)) {
    return fail("test_zero_timestamp_fails_only_r4", "is_valid should be false");
  }
  return 0;
}

int test_function_out_of_range_fails_only_r1() {
  auto record = reference_record();
  record.functions.norm = 1.5;
  if (failed_ids(record) != std::set<std::string_view>{"INV-R1"}) {
    return fail("test_function_out_of_range_fails_only_r1", "only INV-R1 should fail for norm=1.5");
  }

  record = reference_record();
  record.functions.baseline = -0.1;
  if (failed_ids(record) != std::set<std::string_view>{"INV-R1"}) {
    return fail("test_function_out_of_range_fails_only_r1", "only INV-R1 should fail for baseline=-0.1");
  }

  record = reference_record();
  record.functions.meta_control = std::numeric_limits<double>::quiet_NaN();
  if (failed_ids(record) != std::set<std::string_view>{"INV-R1"}) {
    return fail("test_function_out_of_range_fails_only_r1", "only INV-R1 should fail for NaN");
  }
  return 0;
}

int test_stability_score_out_of_range_fails_only_r2() {
  auto record = reference_record();
  record.stability_score = 1.5;
  if (failed_ids(record) != std::set<std::string_view>{"INV-R2"}) {
    return fail("test_stability_score_out_of_range_fails_only_r2", "only INV-R2 should fail");
  }

  record.stability_score = std::numeric_limits<double>::quiet_NaN();
  if (failed_ids(record) != std::set<std::string_view>{"INV-R2"}) {
    return fail("test_stability_score_out_of_range_fails_only_r2", "NaN stability_score should fail INV-R2 only");
  }
  return 0;
}

int test_unmappable_risk_score_fails_r3_and_consistency() {
  auto record = reference_record();
  record.risk_score = -0.1;
  const std::set<std::string_view> expected{"INV-R3", "INV-C1", "INV-C3"};
  if (failed_ids(record) != expected) {
    return fail("test_unmappable_risk_score_fails_r3_and_consistency", "expected R3, C1 and C3 to fail");
  }

  record.risk_score = std::numeric_limits<double>::quiet_NaN();
  if (failed_ids(record) != expected) {
    return fail("test_unmappable_risk_score_fails_r3_and_consistency", "NaN risk_score should fail R3, C1 and C3");
  }
  return 0;
}

int test_mode_mismatch_fails_c1_and_c3() {
  auto record = reference_record();
  record.mode = operating_mode::Halt;
  record.risk_level = risk_class::L5;
  if (failed_ids(record) != std::set<std::string_view>{"INV-C1", "INV-C3"}) {
    return fail("test_mode_mismatch_fails_c1_and_c3", "Halt at risk 0.42 should fail C1 and C3 only");
  }
  return 0;
}

int test_c1_detail_keeps_full_precision() {
  const auto record =
      make_record(Functions{0.25, 0.70, 0.30, 0.20}, 0.58, 0.19999999, operating_mode::Normal, risk_class::L2, 1707500000);
  const auto results = validate_all(record);
  const InvariantResult& c1 = results[4];
  if (c1.id != "INV-C1" || c1.passed) {
    return fail("test_c1_detail_keeps_full_precision", "0.19999999 with mode=Normal should fail C1");
  }
  if (c1.detail.find("risk_score=0.19999999 ") == std::string::npos) {
    return fail("test_c1_detail_keeps_full_precision", "detail should print risk_score=0.19999999");
  }
  if (c1.detail.find("expected mode=Optimal") == std::string::npos) {
    return fail("test_c1_detail_keeps_full_precision", "detail should name Optimal as the expected mode");
  }
  return 0;
}

int test_level_mismatch_fails_c2_and_c3() {
  auto record = reference_record();
  record.risk_level = risk_class::L4;
  if (failed_ids(record) != std::set<std::string_view>{"INV-C2", "INV-C3"}) {
    return fail("test_level_mismatch_fails_c2_and_c3", "Caution/L4 should fail C2 and C3 only");
  }

  const auto results = validate_all(record);
  const auto& c2 = results[5];
  if (c2.detail.find("expected risk_level=L3") == std::string::npos ||
      c2.detail.find("actual risk_level=L4") == std::string::npos) {
    return fail("test_level_mismatch_fails_c2_and_c3", "C2 detail should report expected and actual levels");
  }
  return 0;
}

int test_c3_is_conjunction_of_c1_and_c2() {
  std::vector<RuntimeStateRecord> records;
  records.push_back(reference_record());
  auto mode_off = reference_record();
  mode_off.mode = operating_mode::Normal;
  records.push_back(mode_off);
  auto level_off = reference_record();
  level_off.risk_level = risk_class::L1;
  records.push_back(level_off);
  auto both_off = reference_record();
  both_off.mode = operating_mode::Optimal;
  both_off.risk_level = risk_class::L5;
  records.push_back(both_off);

  for (const auto& record : records) {
    const auto results = validate_all(record);
    if (results[6].passed != (results[4].passed && results[5].passed)) {
      return fail("test_c3_is_conjunction_of_c1_and_c2", "INV-C3 must equal INV-C1 and INV-C2");
    }
  }
  return 0;
}

int test_empty_strings_fail_s1() {
  auto record = reference_record();
  record.schema_version.clear();
  if (failed_ids(record) != std::set<std::string_view>{"INV-S1", "INV-S4"}) {
    return fail("test_empty_strings_fail_s1", "empty schema_version should fail S1 and S4");
  }

  record = reference_record();
  record.spec_version.clear();
  if (failed_ids(record) != std::set<std::string_view>{"INV-S1", "INV-S3"}) {
    return fail("test_empty_strings_fail_s1", "empty spec_version should fail S1 and S3");
  }

  const auto results = validate_all(record);
  if (results[7].detail.find("spec_version") == std::string::npos) {
    return fail("test_empty_strings_fail_s1", "S1 detail should name the empty field");
  }
  return 0;
}

int test_spec_version_exact_match() {
  auto record = reference_record();
  record.spec_version = "pmatrix-3.4";
  if (failed_ids(record) != std::set<std::string_view>{"INV-S3"}) {
    return fail("test_spec_version_exact_match", "older spec_version should fail S3 only");
  }

  record.spec_version = "pmatrix-3.5 ";
  if (failed_ids(record) != std::set<std::string_view>{"INV-S3"}) {
    return fail("test_spec_version_exact_match", "trailing whitespace is not the current spec_version");
  }
  return 0;
}

int test_schema_version_shape() {
  const char* accepted[] = {"1.0.0", "0.0.0", "10.20.30", "01.2.3", "4294967295.0.0"};
  for (const char* version : accepted) {
    auto record = reference_record();
    record.schema_version = version;
    if (!is_valid(record)) {
      return fail("test_schema_version_shape", "three non-negative integers should pass S4");
    }
  }

  const char* rejected[] = {"1.0", "1.0.0.0", "1.0.a", "v1.0.0", "1..0", "1.0.-1", "1.0.+1", " 1.0.0", "1.0.0-rc1",
                           "4294967296.0.0", "1.99999999999999999999.0"};
  for (const char* version : rejected) {
    auto record = reference_record();
    record.schema_version = version;
    if (failed_ids(record) != std::set<std::string_view>{"INV-S4"}) {
      return fail("test_schema_version_shape", "malformed schema_version should fail S4 only");
    }
  }
  return 0;
}

int test_s2_and_t1_always_pass_on_single_record() {
  auto record = reference_record();
  record.timestamp = 0;
  record.functions.norm = 2.0;
  record.risk_score = 3.0;
  record.spec_version.clear();

  const auto results = validate_all(record);
  if (results.size() != kInvariantCount) {
    return fail("test_s2_and_t1_always_pass_on_single_record", "all checks run even when many fail");
  }
  if (!results[8].passed || !results[11].passed) {
    return fail("test_s2_and_t1_always_pass_on_single_record", "S2 and T1 are informational passes");
  }
  if (results[11].detail.find("validate_stream_t1") == std::string::npos) {
    return fail("test_s2_and_t1_always_pass_on_single_record", "T1 note should point at the stream check");
  }
  return 0;
}

int test_no_formula_cross_check() {
  auto record = reference_record();
  record.stability_score = 0.99;
  record.risk_score = 0.05;
  record.mode = operating_mode::Optimal;
  record.risk_level = risk_class::L1;
  if (!is_valid(record)) {
    return fail("test_no_formula_cross_check", "scores are not required to derive from functions");
  }
  return 0;
}

int test_stream_t1() {
  const auto at = [](const std::uint64_t timestamp) {
    auto record = reference_record();
    record.timestamp = timestamp;
    return record;
  };

  if (validate_stream_t1({at(1000), at(1000), at(1001)}).has_value()) {
    return fail("test_stream_t1", "equal timestamps are allowed");
  }

  const auto violation = validate_stream_t1({at(1001), at(1000)});
  if (!violation.has_value() || *violation != 1) {
    return fail("test_stream_t1", "expected violation at index 1");
  }

  const auto first = validate_stream_t1({at(5), at(6), at(4), at(3)});
  if (!first.has_value() || *first != 2) {
    return fail("test_stream_t1", "expected first violation index only");
  }

  if (validate_stream_t1({}).has_value() || validate_stream_t1({at(7)}).has_value()) {
    return fail("test_stream_t1", "empty and single-record streams cannot violate ordering");
  }
  return 0;
}

int test_stream_report() {
  auto good = reference_record();
  auto bad = reference_record();
  bad.timestamp = 0;

  const auto report = validate_stream({good, bad});
  if (report.record_count != 2) {
    return fail("test_stream_report", "record count mismatch");
  }
  if (report.nonconforming_records != std::vector<std::size_t>{1}) {
    return fail("test_stream_report", "record 1 should be reported as nonconforming");
  }
  if (!report.t1_violation.has_value() || *report.t1_violation != 1) {
    return fail("test_stream_report", "timestamp 0 after 1707500000 violates ordering");
  }
  if (report.conforming()) {
    return fail("test_stream_report", "report should not conform");
  }

  if (!validate_stream({good, good}).conforming()) {
    return fail("test_stream_report", "two identical conforming records form a conforming stream");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_reference_record_conforms(); rc != 0) {
    return rc;
  }
  if (int rc = test_boundary_records_conform(); rc != 0) {
    return rc;
  }
  if (int rc = test_zero_timestamp_fails_only_r4(); rc != 0) {
    return rc;
  }
  if (int rc = test_function_out_of_range_fails_only_r1(); rc != 0) {
    return rc;
  }
  if (int rc = test_stability_score_out_of_range_fails_only_r2(); rc != 0) {
    return rc;
  }
  if (int rc = test_unmappable_risk_score_fails_r3_and_consistency(); rc != 0) {
    return rc;
  }
  if (int rc = test_mode_mismatch_fails_c1_and_c3(); rc != 0) {
    return rc;
  }
  if (int rc = test_c1_detail_keeps_full_precision(); rc != 0) {
    return rc;
  }
  if (int rc = test_level_mismatch_fails_c2_and_c3(); rc != 0) {
    return rc;
  }
  if (int rc = test_c3_is_conjunction_of_c1_and_c2(); rc != 0) {
    return rc;
  }
  if (int rc = test_empty_strings_fail_s1(); rc != 0) {
    return rc;
  }
  if (int rc = test_spec_version_exact_match(); rc != 0) {
    return rc;
  }
  if (int rc = test_schema_version_shape(); rc != 0) {
    return rc;
  }
  if (int rc = test_s2_and_t1_always_pass_on_single_record(); rc != 0) {
    return rc;
  }
  if (int rc = test_no_formula_cross_check(); rc != 0) {
    return rc;
  }
  if (int rc = test_stream_t1(); rc != 0) {
    return rc;
  }
  if (int rc = test_stream_report(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] validation unit tests\n";
  return 0;
}
