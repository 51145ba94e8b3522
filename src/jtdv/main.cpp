#include "jtdv/cli/router.hpp"

#include <iostream>

int main(int argc, char** argv) {
  // Instances are read one character at a time; unsynchronized streams keep
  // std::cin from going through stdio for every byte.
  std::ios::sync_with_stdio(false);

  // Argument parsing, source handling and the exit-code contract live in the
  // CLI router.
  return jtdv::cli::Dispatch(argc, argv);
}
