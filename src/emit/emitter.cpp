#include "emit/emitter.hpp"

#include <array>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

#include "core/errors.hpp"
#include "core/format.hpp"
#include "core/timestamp.hpp"
#include "emit/demo_aggregation.hpp"
#include "risk/partition.hpp"

namespace pmatrix::emit {
namespace {

void require_unit_input(const char* name, const double value) {
  if (!std::isfinite(value)) {
    std::ostringstream message;
    message << name << " = " << core::format_double(value) << " is NaN or infinite";
    throw core::InputRejected(message.str());
  }
  if (value < 0.0 || value > 1.0) {
    std::ostringstream message;
    message << name << " = " << core::format_double(value) << " is outside [0.0, 1.0]";
    throw core::InputRejected(message.str());
  }
}

}  // namespace

model::RuntimeStateRecord emit_demo_record(const EmitInputs& inputs) {
  const std::array<std::pair<const char*, double>, 4> named_inputs = {{
      {"baseline", inputs.baseline},
      {"norm", inputs.norm},
      {"stability", inputs.stability},
      {"meta_control", inputs.meta_control},
  }};
  for (const auto& [name, value] : named_inputs) {
    require_unit_input(name, value);
  }

  model::RuntimeStateRecord record{};
  record.functions = model::Functions{inputs.baseline, inputs.norm, inputs.stability, inputs.meta_control};
  record.stability_score = demo_stability_score(record.functions);
  record.risk_score = demo_risk_score(record.stability_score);

  const auto mode = risk::map_risk_to_mode(record.risk_score);
  if (!mode.has_value()) {
    std::ostringstream message;
    message << "risk_score " << core::format_double(record.risk_score) << " is outside the partition domain";
    throw core::InternalInconsistency(message.str());
  }
  record.mode = *mode;
  record.risk_level = risk::map_mode_to_level(*mode);

  record.spec_version = std::string(model::kSpecVersion);
  record.schema_version = std::string(model::kSchemaVersion);
  record.timestamp = inputs.timestamp.has_value() ? *inputs.timestamp : core::unix_timestamp_now_s();

  return record;
}

}  // namespace pmatrix::emit
