#pragma once

#include <chrono>
#include <cstdint>

namespace pmatrix::core {

inline std::uint64_t unix_timestamp_now_s() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

}  // namespace pmatrix::core
