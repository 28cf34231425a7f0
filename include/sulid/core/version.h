#pragma once

namespace sulid::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.6";

}  // namespace sulid::core
