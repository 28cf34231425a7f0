#pragma once

#include "generate_logic.h"

#include <string>
#include <vector>

#include "shared/arg_parser.h"

namespace sulid::cli {

// generate_options is the flag registry of `sulid_cli generate`.
[[nodiscard]] std::vector<apps::Option<GenerateCliConfig>> generate_options();

// parse_generate_args parses argv[2..] into a GenerateCliConfig.
[[nodiscard]] GenerateCliConfig parse_generate_args(int argc,
                                                    char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_generate: parse, validate, build a live generator and print ids.
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace sulid::cli
