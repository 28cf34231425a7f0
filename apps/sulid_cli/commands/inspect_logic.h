#pragma once

#include <ostream>
#include <string>

namespace sulid::cli {

// Exit statuses shared by the inspect subcommands.
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitExhausted = 2;

// execute_decode parses text and writes its JSON view with both the V1 and V2
// projections: {"id", "random_hex", "timestamp_ms", "v1": {...}, "v2": {...}}.
// A decode failure is written to err and returns kExitError.
int execute_decode(const std::string& text, std::ostream& out, std::ostream& err);

// execute_increment writes the JSON view of the successor of text.
// Returns kExitExhausted (and writes {"exhausted": true}) when the random
// field is saturated.
int execute_increment(const std::string& text, std::ostream& out, std::ostream& err);

// execute_nil writes the JSON view of the nil id.
int execute_nil(std::ostream& out);

// execute_config writes the library's build switches and version.
int execute_config(std::ostream& out);

}  // namespace sulid::cli
