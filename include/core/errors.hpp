#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace pmatrix::core {

class Error : public std::runtime_error {
 public:
  explicit Error(std::string message) : std::runtime_error(std::move(message)) {}
};

// Raw emitter input that is NaN, infinite, or outside [0.0, 1.0].
class InputRejected : public Error {
 public:
  explicit InputRejected(std::string message) : Error(std::move(message)) {}
};

// Bytes that do not satisfy the wire contract. Validation is never attempted on them.
class DecodeError : public Error {
 public:
  explicit DecodeError(std::string message) : Error(std::move(message)) {}
};

// The mapper rejected a score the emitter computed itself.
class InternalInconsistency : public Error {
 public:
  explicit InternalInconsistency(std::string message) : Error(std::move(message)) {}
};

}  // namespace pmatrix::core
