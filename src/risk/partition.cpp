#include "risk/partition.hpp"

#include <cmath>

namespace pmatrix::risk {

std::optional<model::operating_mode> map_risk_to_mode(const double risk_score) noexcept {
  if (std::isnan(risk_score) || risk_score < 0.0 || risk_score > 1.0) {
    return std::nullopt;
  }

  if (risk_score < kNormalFloor) {
    return model::operating_mode::Optimal;
  }
  if (risk_score < kCautionFloor) {
    return model::operating_mode::Normal;
  }
  if (risk_score < kAlertFloor) {
    return model::operating_mode::Caution;
  }
  if (risk_score < kHaltFloor) {
    return model::operating_mode::Alert;
  }
  return model::operating_mode::Halt;
}

model::risk_class map_mode_to_level(const model::operating_mode mode) noexcept {
  switch (mode) {
    case model::operating_mode::Optimal:
      return model::risk_class::L1;
    case model::operating_mode::Normal:
      return model::risk_class::L2;
    case model::operating_mode::Caution:
      return model::risk_class::L3;
    case model::operating_mode::Alert:
      return model::risk_class::L4;
    case model::operating_mode::Halt:
      return model::risk_class::L5;
  }
  return model::risk_class::L5;
}

std::optional<model::risk_class> map_mode_to_level(const std::string_view mode_name) noexcept {
  const auto mode = model::parse_mode(mode_name);
  if (!mode.has_value()) {
    return std::nullopt;
  }
  return map_mode_to_level(*mode);
}

model::operating_mode mode_for_level(const model::risk_class level) noexcept {
  switch (level) {
    case model::risk_class::L1:
      return model::operating_mode::Optimal;
    case model::risk_class::L2:
      return model::operating_mode::Normal;
    case model::risk_class::L3:
      return model::operating_mode::Caution;
    case model::risk_class::L4:
      return model::operating_mode::Alert;
    case model::risk_class::L5:
      return model::operating_mode::Halt;
  }
  return model::operating_mode::Halt;
}

}  // namespace pmatrix::risk
