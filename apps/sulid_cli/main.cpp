#include "sulid/core/version.h"

#include "commands/generate.h"
#include "commands/inspect.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "sulid_cli v" << sulid::core::kBuildVersion << "\n"
            << "Usage: sulid_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  generate   Generate new ids\n"
            << "  decode     Show the fields of an id\n"
            << "  increment  Show the next id in the same millisecond\n"
            << "  nil        Show the nil id\n"
            << "  config     Show the library build switches\n\n"
            << "generate options:\n";
  sulid::apps::print_options(std::cerr, sulid::cli::generate_options());
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return sulid::cli::cmd_generate(argc, argv);
  }
  if (subcommand == "decode") {
    return sulid::cli::cmd_decode(argc, argv);
  }
  if (subcommand == "increment") {
    return sulid::cli::cmd_increment(argc, argv);
  }
  if (subcommand == "nil") {
    return sulid::cli::cmd_nil();
  }
  if (subcommand == "config") {
    return sulid::cli::cmd_config();
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
