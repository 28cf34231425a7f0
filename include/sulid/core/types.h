#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace sulid::core {

// Uint128 is the native 128-bit unsigned integer backing every identifier.
// GCC and Clang provide it on 64-bit targets; __extension__ keeps -Wpedantic quiet.
__extension__ typedef unsigned __int128 Uint128;

constexpr std::size_t kByteLength = 16;

// ByteArray is the big-endian binary form: byte 0 is the most significant byte.
using ByteArray = std::array<std::uint8_t, kByteLength>;

// bitmask returns a right-aligned mask of `bits` ones (bits must be < 128).
constexpr Uint128 bitmask(const unsigned bits) noexcept {
  return (Uint128{1} << bits) - 1;
}

}  // namespace sulid::core
