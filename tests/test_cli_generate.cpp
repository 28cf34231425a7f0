#include <catch2/catch.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "commands/generate.h"
#include "commands/generate_logic.h"
#include "sulid/core/clock.h"
#include "sulid/core/random_source.h"
#include "sulid/core/sulid_json.h"

using namespace sulid::cli;
using sulid::core::SulidVersion;
using sulid::generator::SulidGenerator;
using sulid::generator::V1Identity;
using sulid::generator::V2Identity;

static std::vector<char*> to_argv(std::vector<std::string>& args) {
  std::vector<char*> argv;
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  return argv;
}

// ── validate_generate_config ────────────────────────────────────────────────

TEST_CASE("validate_generate_config: defaults are valid", "[cli][generate]") {
  GenerateCliConfig config;
  CHECK(validate_generate_config(config).empty());
  CHECK(uses_default_identity(config));
}

TEST_CASE("validate_generate_config: V1 ranges", "[cli][generate]") {
  GenerateCliConfig config;
  config.data_center_id = 31;
  config.machine_id = 31;
  CHECK(validate_generate_config(config).empty());

  config.data_center_id = 32;
  CHECK(validate_generate_config(config) == "Error: --data-center must be in the range 0-31.");

  config.data_center_id = 0;
  config.machine_id = 32;
  CHECK(validate_generate_config(config) == "Error: --machine must be in the range 0-31.");
}

TEST_CASE("validate_generate_config: V2 range", "[cli][generate]") {
  GenerateCliConfig config;
  config.version = SulidVersion::kV2;
  config.worker_id = 1023;
  CHECK(validate_generate_config(config).empty());

  config.worker_id = 1024;
  CHECK(validate_generate_config(config) == "Error: --worker must be in the range 0-1023.");
}

TEST_CASE("validate_generate_config: layouts are not mixed", "[cli][generate]") {
  SECTION("--worker with V1") {
    GenerateCliConfig config;
    config.worker_id = 3;
    CHECK(validate_generate_config(config).find("--worker applies to --v2 only") !=
          std::string::npos);
  }

  SECTION("--machine with V2") {
    GenerateCliConfig config;
    config.version = SulidVersion::kV2;
    config.machine_id = 3;
    CHECK(validate_generate_config(config).find("apply to --v1 only") != std::string::npos);
  }
}

TEST_CASE("validate_generate_config: count and parse errors", "[cli][generate]") {
  GenerateCliConfig config;
  config.count = 0;
  CHECK(validate_generate_config(config) == "Error: --count must be in the range 1-10000.");

  config.count = 10001;
  CHECK_FALSE(validate_generate_config(config).empty());

  config.count = 1;
  config.parse_errors = 2;
  CHECK(validate_generate_config(config) ==
        "Error: invalid arguments for generate (see messages above).");
}

// ── build_identity ──────────────────────────────────────────────────────────

TEST_CASE("build_identity: fills defaults and given ids", "[cli][generate]") {
  GenerateCliConfig v1;
  v1.machine_id = 9;
  CHECK_FALSE(uses_default_identity(v1));
  const auto id1 = build_identity(v1);
  REQUIRE(std::holds_alternative<V1Identity>(id1));
  CHECK(std::get<V1Identity>(id1).data_center_id == kDefaultDataCenterId);
  CHECK(std::get<V1Identity>(id1).machine_id == 9);

  GenerateCliConfig v2;
  v2.version = SulidVersion::kV2;
  const auto id2 = build_identity(v2);
  REQUIRE(std::holds_alternative<V2Identity>(id2));
  CHECK(std::get<V2Identity>(id2).worker_id == kDefaultWorkerId);
}

// ── parse_generate_args ─────────────────────────────────────────────────────

TEST_CASE("parse_generate_args: reads every flag", "[cli][generate]") {
  std::vector<std::string> args = {"sulid_cli", "generate", "--v2",    "--worker",
                                   "700",       "--count",  "3",       "--at-ms",
                                   "1717171717171"};
  auto argv = to_argv(args);
  const auto config = parse_generate_args(static_cast<int>(argv.size()), argv.data());

  CHECK(config.parse_errors == 0);
  CHECK(config.version == SulidVersion::kV2);
  CHECK(config.worker_id == 700u);
  CHECK(config.count == 3);
  CHECK(config.at_ms == 1717171717171);
}

TEST_CASE("parse_generate_args: malformed numbers are counted", "[cli][generate]") {
  std::vector<std::string> args = {"sulid_cli", "generate", "--data-center", "-1", "--count",
                                   "many"};
  auto argv = to_argv(args);
  const auto config = parse_generate_args(static_cast<int>(argv.size()), argv.data());

  CHECK(config.parse_errors == 2);
  CHECK_FALSE(validate_generate_config(config).empty());
}

// ── execute_generate ────────────────────────────────────────────────────────

TEST_CASE("execute_generate: writes count ids at the given time", "[cli][generate]") {
  GenerateCliConfig config;
  config.data_center_id = 3;
  config.machine_id = 17;
  config.count = 2;
  config.at_ms = 1717171717171;

  SulidGenerator generator(build_identity(config), std::make_unique<sulid::core::FixedClock>(0),
                           std::make_unique<sulid::core::StepRandomSource>(123456789, 1));

  std::ostringstream out;
  CHECK(execute_generate(config, generator, out) == 0);

  const auto j = nlohmann::json::parse(out.str());
  REQUIRE(j.at("ids").size() == 2);
  CHECK(j["ids"][0].at("id") == "01HZ7PJ11K000000003NQK8N3H");
  CHECK(j["ids"][0].at("version") == "v1");
  CHECK(j["ids"][0].at("timestamp_ms") == 1717171717171);
  CHECK(j["ids"][1].at("random_hex") == "000000000000000000000000075bcd16");
}

TEST_CASE("execute_generate: V2 ids carry the worker id", "[cli][generate]") {
  GenerateCliConfig config;
  config.version = SulidVersion::kV2;
  config.worker_id = 511;
  config.count = 1;

  SulidGenerator generator(build_identity(config),
                           std::make_unique<sulid::core::FixedClock>(1549744931023),
                           std::make_unique<sulid::core::StepRandomSource>(7, 0));

  std::ostringstream out;
  CHECK(execute_generate(config, generator, out) == 0);

  const auto j = nlohmann::json::parse(out.str());
  const auto id = sulid::core::sulid_from_json(j["ids"][0]);
  CHECK(id.worker_id() == 511);
  CHECK(id.timestamp_ms() == 1549744931023ull);
  CHECK(j["ids"][0].at("worker_id") == 511);
}
