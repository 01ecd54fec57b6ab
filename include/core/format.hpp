#pragma once

#include <cmath>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace pmatrix::core {

// Shortest text that reads back as the same double, matching the wire encoding.
// JSON has no NaN or infinity, so those fall back to the stream spelling.
inline std::string format_double(const double value) {
  if (!std::isfinite(value)) {
    std::ostringstream out;
    out << value;
    return out.str();
  }
  return nlohmann::json(value).dump();
}

}  // namespace pmatrix::core
