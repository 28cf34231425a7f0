#pragma once

#include <string>

// Build-time switches. CMake sets these as PUBLIC compile definitions of
// sulid_core; the defaults below apply when the headers are used without it.
//
// SULID_STRICT_ASSERT  1: out-of-range parts throw PreconditionViolation
//                      0: out-of-range parts are masked to their bit width
// SULID_FULL_PROFILE   1: system clock, process randomness, owned strings
//                      0: pure computation only; caller supplies time and randomness
// SULID_SHARED_RNG     1: a generator's randomness source is guarded by std::mutex
//                      0: no locking; single-threaded use only
#ifndef SULID_STRICT_ASSERT
#define SULID_STRICT_ASSERT 0
#endif

#ifndef SULID_FULL_PROFILE
#define SULID_FULL_PROFILE 1
#endif

#ifndef SULID_SHARED_RNG
#define SULID_SHARED_RNG 1
#endif

namespace sulid::core {

constexpr bool kStrictAssert = SULID_STRICT_ASSERT != 0;
constexpr bool kFullProfile = SULID_FULL_PROFILE != 0;
constexpr bool kSharedRng = SULID_SHARED_RNG != 0;

// build_config_summary describes the switches the library was compiled with,
// e.g. "profile=full assert=masking rng=shared".
// Reports the library's own translation unit, not the caller's.
[[nodiscard]] std::string build_config_summary();

}  // namespace sulid::core
