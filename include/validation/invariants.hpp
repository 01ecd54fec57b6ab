#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model/runtime_state.hpp"

namespace pmatrix::validation {

inline constexpr std::size_t kInvariantCount = 12;

struct InvariantResult {
  std::string_view id;
  bool passed{false};
  std::string detail;
};

// Runs every single-record check in fixed order R1..R4, C1..C3, S1..S4, T1.
// Never short-circuits and never mutates the record.
std::vector<InvariantResult> validate_all(const model::RuntimeStateRecord& record);

[[nodiscard]] bool is_valid(const model::RuntimeStateRecord& record);

// Index of the first record whose timestamp is strictly less than its predecessor's.
// Equal consecutive timestamps are allowed.
std::optional<std::size_t> validate_stream_t1(const std::vector<model::RuntimeStateRecord>& records) noexcept;

struct StreamReport {
  std::size_t record_count{0};
  std::vector<std::size_t> nonconforming_records{};
  std::optional<std::size_t> t1_violation{};

  [[nodiscard]] bool conforming() const noexcept { return nonconforming_records.empty() && !t1_violation.has_value(); }
};

// Records must be presented in emission order.
StreamReport validate_stream(const std::vector<model::RuntimeStateRecord>& records);

}  // namespace pmatrix::validation
