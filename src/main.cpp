#include <iostream>

#include "cli/commands.hpp"

int main(int argc, char** argv) {
  return pmatrix::cli::run(argc, argv, std::cin, std::cout, std::cerr);
}
