#pragma once

#include <iosfwd>

namespace pmatrix::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitDecodeFailure = 2;
inline constexpr int kExitUsage = 64;

// Entry point shared by main() and the tests. argv[0] is the program name.
// Command output goes to out, diagnostics to err.
int run(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err);

void print_usage(std::ostream& os);

}  // namespace pmatrix::cli
