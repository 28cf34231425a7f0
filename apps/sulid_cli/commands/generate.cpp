#include "generate.h"

#include "sulid/core/config.h"
#include "sulid/core/version.h"

#include <charconv>
#include <iostream>
#include <optional>
#include <system_error>

namespace sulid::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Value Parsing
// ────────────────────────────────────────────────────────────────

template <typename Int>
std::optional<Int> parse_integer(const std::string& value) {
  Int parsed{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last || value.empty()) {
    return std::nullopt;
  }
  return parsed;
}

bool assign_unsigned(std::optional<unsigned>& field, const std::string& flag,
                     const std::string& value) {
  const auto parsed = parse_integer<unsigned>(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected a non-negative integer)\n";
    return false;
  }
  field = parsed;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_v1(GenerateCliConfig& config, const std::string& /*value*/) {
  config.version = core::SulidVersion::kV1;
  return true;
}

bool handle_v2(GenerateCliConfig& config, const std::string& /*value*/) {
  config.version = core::SulidVersion::kV2;
  return true;
}

bool handle_data_center(GenerateCliConfig& config, const std::string& value) {
  return assign_unsigned(config.data_center_id, "--data-center", value);
}

bool handle_machine(GenerateCliConfig& config, const std::string& value) {
  return assign_unsigned(config.machine_id, "--machine", value);
}

bool handle_worker(GenerateCliConfig& config, const std::string& value) {
  return assign_unsigned(config.worker_id, "--worker", value);
}

bool handle_count(GenerateCliConfig& config, const std::string& value) {
  const auto parsed = parse_integer<unsigned>(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --count: " << value << " (expected a positive integer)\n";
    return false;
  }
  config.count = parsed.value();
  return true;
}

bool handle_at_ms(GenerateCliConfig& config, const std::string& value) {
  const auto parsed = parse_integer<std::int64_t>(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --at-ms: " << value << " (expected milliseconds since the Unix epoch)\n";
    return false;
  }
  config.at_ms = parsed;
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<GenerateCliConfig>> generate_options() {
  return {
      {"--v1", false, "Data center + machine layout (default)", handle_v1},
      {"--v2", false, "Single worker id layout", handle_v2},
      {"--data-center", true, "V1 data center id (0-31)", handle_data_center},
      {"--machine", true, "V1 machine id (0-31)", handle_machine},
      {"--worker", true, "V2 worker id (0-1023)", handle_worker},
      {"--count", true, "Number of ids to generate (default 5)", handle_count},
      {"--at-ms", true, "Use this Unix time in ms instead of the system clock", handle_at_ms},
  };
}

GenerateCliConfig parse_generate_args(int argc, char* argv[]) {
  int errors = 0;
  auto config = apps::parse_options(argc, argv, generate_options(), 2, GenerateCliConfig{}, &errors);
  config.parse_errors += errors;
  return config;
}

int cmd_generate(int argc, char* argv[]) {
  const auto config = parse_generate_args(argc, argv);

  // Validate before any output so no partial messages appear on error.
  const std::string config_error = validate_generate_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "sulid v" << core::kBuildVersion << " (" << core::build_config_summary() << ")\n";
  if (uses_default_identity(config)) {
    std::cerr << "WARNING: No worker identity specified. Using the default identity.\n"
                 "         Generators running on other machines MUST use distinct identities\n"
                 "         or their ids can collide. Pass --data-center/--machine or --worker.\n";
  }
  if (config.at_ms.has_value()) {
    std::cerr << "Clock:       fixed -- " << config.at_ms.value() << " ms\n";
  } else {
    std::cerr << "Clock:       system\n";
  }
  // ─────────────────────────────────────────────────────────────────────────

  try {
    generator::SulidGenerator generator(build_identity(config));
    return execute_generate(config, generator, std::cout);
  } catch (const core::PreconditionViolation& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace sulid::cli
