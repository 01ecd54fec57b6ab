#pragma once

#include <cstdint>
#include <optional>

#include "model/runtime_state.hpp"

namespace pmatrix::emit {

struct EmitInputs {
  double baseline{0.0};
  double norm{0.0};
  double stability{0.0};
  double meta_control{0.0};
  // Wall-clock seconds are used when absent.
  std::optional<std::uint64_t> timestamp{};
};

// Builds a demonstration record. Throws core::InputRejected naming the first
// offending field before anything is built, or core::InternalInconsistency if
// the partition mapper refuses the computed risk_score.
model::RuntimeStateRecord emit_demo_record(const EmitInputs& inputs);

}  // namespace pmatrix::emit
