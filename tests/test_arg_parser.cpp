#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "shared/arg_parser.h"

using sulid::apps::Option;
using sulid::apps::parse_options;
using sulid::apps::print_options;

namespace {

struct DemoConfig {
  bool verbose{false};  // NOLINT(readability-identifier-naming)
  std::string name;     // NOLINT(readability-identifier-naming)
};

std::vector<Option<DemoConfig>> demo_options() {
  return {
      {"--verbose", false, "Print more",
       [](DemoConfig& c, const std::string&) {
         c.verbose = true;
         return true;
       }},
      {"--name", true, "Set the name",
       [](DemoConfig& c, const std::string& v) {
         if (v.empty()) {
           return false;
         }
         c.name = v;
         return true;
       }},
  };
}

// Owns the argument strings so argv stays valid for the call.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& s : storage) {
      pointers.push_back(s.data());
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;  // NOLINT(readability-identifier-naming)
  std::vector<char*> pointers;       // NOLINT(readability-identifier-naming)
};

}  // namespace

TEST_CASE("parse_options: flags and values", "[arg_parser]") {
  Argv args({"prog", "sub", "--verbose", "--name", "alpha"});
  int errors = -1;
  const auto config = parse_options(args.argc(), args.argv(), demo_options(), 2, DemoConfig{}, &errors);

  CHECK(errors == 0);
  CHECK(config.verbose);
  CHECK(config.name == "alpha");
}

TEST_CASE("parse_options: start index skips leading tokens", "[arg_parser]") {
  Argv args({"prog", "--verbose"});
  const auto config = parse_options(args.argc(), args.argv(), demo_options(), 2);
  CHECK_FALSE(config.verbose);
}

TEST_CASE("parse_options: errors are counted", "[arg_parser]") {
  SECTION("unknown flag") {
    Argv args({"prog", "--bogus"});
    int errors = 0;
    (void)parse_options(args.argc(), args.argv(), demo_options(), 1, DemoConfig{}, &errors);
    CHECK(errors == 1);
  }

  SECTION("missing value") {
    Argv args({"prog", "--name"});
    int errors = 0;
    const auto config = parse_options(args.argc(), args.argv(), demo_options(), 1, DemoConfig{}, &errors);
    CHECK(errors == 1);
    CHECK(config.name.empty());
  }

  SECTION("handler rejection") {
    Argv args({"prog", "--name", ""});
    int errors = 0;
    (void)parse_options(args.argc(), args.argv(), demo_options(), 1, DemoConfig{}, &errors);
    CHECK(errors == 1);
  }

  SECTION("positional tokens are ignored") {
    Argv args({"prog", "positional", "--verbose"});
    int errors = 0;
    const auto config = parse_options(args.argc(), args.argv(), demo_options(), 1, DemoConfig{}, &errors);
    CHECK(errors == 0);
    CHECK(config.verbose);
  }
}

TEST_CASE("parse_options: default config is the starting point", "[arg_parser]") {
  Argv args({"prog"});
  DemoConfig defaults;
  defaults.name = "preset";
  const auto config = parse_options(args.argc(), args.argv(), demo_options(), 1, defaults);
  CHECK(config.name == "preset");
}

TEST_CASE("print_options lists every flag", "[arg_parser]") {
  std::ostringstream out;
  print_options(out, demo_options());
  CHECK(out.str() == "  --verbose  Print more\n  --name <value>  Set the name\n");
}
