#pragma once

#include "model/runtime_state.hpp"

namespace pmatrix::emit {

// Placeholder arithmetic used only to populate the derived score fields of
// demonstration records. Not an evaluation formula.

inline double demo_stability_score(const model::Functions& f) noexcept {
  return (f.baseline + f.norm + f.stability + f.meta_control) / 4.0;
}

inline double demo_risk_score(const double stability_score) noexcept {
  return 1.0 - stability_score;
}

}  // namespace pmatrix::emit
