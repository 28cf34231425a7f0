#pragma once

#include "sulid/core/sulid.h"
#include "sulid/generator/sulid_generator.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace sulid::cli {

// GenerateCliConfig holds the parsed flags of `sulid_cli generate`.
// Every field has an explicit default; optional fields mean "not given".
// Ids are held wider than their bit fields so out-of-range input can be
// reported instead of silently wrapping.
struct GenerateCliConfig {
  core::SulidVersion version{core::SulidVersion::kV1};  // NOLINT(readability-identifier-naming)
  std::optional<unsigned> data_center_id;               // NOLINT(readability-identifier-naming)
  std::optional<unsigned> machine_id;                   // NOLINT(readability-identifier-naming)
  std::optional<unsigned> worker_id;                    // NOLINT(readability-identifier-naming)
  unsigned count{5};                                    // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> at_ms;                    // NOLINT(readability-identifier-naming)
  int parse_errors{0};                                  // NOLINT(readability-identifier-naming)
};

// Identity used when no id flags are given; matches the bundled example.
constexpr unsigned kDefaultDataCenterId = 1;
constexpr unsigned kDefaultMachineId = 1;
constexpr unsigned kDefaultWorkerId = 1;
constexpr unsigned kMaxCount = 10000;

// validate_generate_config checks the flags before any id is produced.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - no flag failed to parse
// - V1 flags (--data-center, --machine) are not mixed with --v2, nor --worker with V1
// - data center and machine ids are 0-31, worker id is 0-1023
// - count is 1-10000
[[nodiscard]] std::string validate_generate_config(const GenerateCliConfig& config);

// uses_default_identity is true when no id flag was given for the chosen version.
[[nodiscard]] bool uses_default_identity(const GenerateCliConfig& config);

// build_identity maps a validated config onto a generator identity.
[[nodiscard]] generator::WorkerIdentity build_identity(const GenerateCliConfig& config);

// execute_generate writes {"ids": [...]} with config.count JSON views to out.
// Uses config.at_ms instead of the generator's clock when present.
int execute_generate(const GenerateCliConfig& config, generator::SulidGenerator& generator,
                     std::ostream& out);

}  // namespace sulid::cli
