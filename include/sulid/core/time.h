#pragma once

#include <chrono>
#include <cstdint>

namespace sulid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_millis(const std::uint64_t millis) {
  return Timestamp{} + std::chrono::milliseconds(static_cast<std::int64_t>(millis));
}

// clamp_to_epoch maps instants before the Unix epoch to 0; identifiers cannot
// carry negative timestamps.
constexpr std::uint64_t clamp_to_epoch(const std::int64_t millis) noexcept {
  return millis < 0 ? 0 : static_cast<std::uint64_t>(millis);
}

}  // namespace sulid::core
