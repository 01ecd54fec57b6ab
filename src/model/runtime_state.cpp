#include "model/runtime_state.hpp"

#include <array>
#include <cstddef>

namespace pmatrix::model {
namespace {

constexpr std::array<std::string_view, 5> kModeNames = {"Optimal", "Normal", "Caution", "Alert", "Halt"};
constexpr std::array<std::string_view, 5> kRiskLevelNames = {"L1", "L2", "L3", "L4", "L5"};

}  // namespace

bool operator==(const Functions& lhs, const Functions& rhs) noexcept {
  return lhs.baseline == rhs.baseline && lhs.norm == rhs.norm && lhs.stability == rhs.stability &&
         lhs.meta_control == rhs.meta_control;
}

bool operator!=(const Functions& lhs, const Functions& rhs) noexcept {
  return !(lhs == rhs);
}

bool operator==(const RuntimeStateRecord& lhs, const RuntimeStateRecord& rhs) noexcept {
  return lhs.spec_version == rhs.spec_version && lhs.schema_version == rhs.schema_version &&
         lhs.timestamp == rhs.timestamp && lhs.functions == rhs.functions &&
         lhs.stability_score == rhs.stability_score && lhs.risk_score == rhs.risk_score && lhs.mode == rhs.mode &&
         lhs.risk_level == rhs.risk_level;
}

bool operator!=(const RuntimeStateRecord& lhs, const RuntimeStateRecord& rhs) noexcept {
  return !(lhs == rhs);
}

std::string_view to_string(const operating_mode value) noexcept {
  return kModeNames[static_cast<std::size_t>(value)];
}

std::string_view to_string(const risk_class value) noexcept {
  return kRiskLevelNames[static_cast<std::size_t>(value)];
}

std::optional<operating_mode> parse_mode(const std::string_view name) noexcept {
  for (std::size_t i = 0; i < kModeNames.size(); ++i) {
    if (kModeNames[i] == name) {
      return kModes[i];
    }
  }
  return std::nullopt;
}

std::optional<risk_class> parse_risk_level(const std::string_view name) noexcept {
  for (std::size_t i = 0; i < kRiskLevelNames.size(); ++i) {
    if (kRiskLevelNames[i] == name) {
      return kRiskLevels[i];
    }
  }
  return std::nullopt;
}

}  // namespace pmatrix::model
