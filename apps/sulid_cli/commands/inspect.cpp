#include "inspect.h"

#include "inspect_logic.h"
#include <iostream>
#include <string>

namespace sulid::cli {

int cmd_decode(int argc, char* argv[]) {
  // Usage: sulid_cli decode <id>
  if (argc < 3) {
    std::cerr << "Usage: sulid_cli decode <id>\n";
    return kExitError;
  }
  return execute_decode(argv[2], std::cout, std::cerr);
}

int cmd_increment(int argc, char* argv[]) {
  // Usage: sulid_cli increment <id>
  if (argc < 3) {
    std::cerr << "Usage: sulid_cli increment <id>\n";
    return kExitError;
  }
  return execute_increment(argv[2], std::cout, std::cerr);
}

int cmd_nil() {
  return execute_nil(std::cout);
}

int cmd_config() {
  return execute_config(std::cout);
}

}  // namespace sulid::cli
