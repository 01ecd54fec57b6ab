#pragma once

#include <optional>
#include <string_view>

#include "model/runtime_state.hpp"

namespace pmatrix::risk {

// Lower bounds of the Normal, Caution, Alert and Halt bands.
inline constexpr double kNormalFloor = 0.2;
inline constexpr double kCautionFloor = 0.4;
inline constexpr double kAlertFloor = 0.6;
inline constexpr double kHaltFloor = 0.8;

// Bands are lower-inclusive/upper-exclusive, except Halt which is [0.8, 1.0].
// Returns nullopt for NaN or anything outside [0.0, 1.0].
std::optional<model::operating_mode> map_risk_to_mode(double risk_score) noexcept;

model::risk_class map_mode_to_level(model::operating_mode mode) noexcept;

// Accepts only the five canonical mode names.
std::optional<model::risk_class> map_mode_to_level(std::string_view mode_name) noexcept;

model::operating_mode mode_for_level(model::risk_class level) noexcept;

}  // namespace pmatrix::risk
