#pragma once

#include <cmath>

namespace pmatrix::core {

inline bool in_unit_interval(const double value) noexcept {
  return !std::isnan(value) && value >= 0.0 && value <= 1.0;
}

}  // namespace pmatrix::core
