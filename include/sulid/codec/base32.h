#pragma once

#include "sulid/core/result.h"
#include "sulid/core/types.h"

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

namespace sulid::codec {

// Crockford Base32 codec for 128-bit values.
//
// Alphabet: 0123456789ABCDEFGHJKMNPQRSTVWXYZ (I, L, O and U are excluded).
// A 128-bit value always encodes to exactly 26 characters; the first character
// carries only the top 3 bits, so it is never above '7'.
// Encoding emits upper case. Decoding also accepts lower case.
// No external dependencies.

constexpr std::size_t kEncodedLength = 26;

using EncodedBuffer = std::array<char, kEncodedLength>;

// encode writes the 26-character form of value into out. Never fails.
void encode(core::Uint128 value, EncodedBuffer& out) noexcept;

// encode_into writes into a caller-provided buffer of any size.
// Returns a view of the first 26 characters of buffer, or kBufferTooSmall.
// The buffer is left untouched on error.
[[nodiscard]] core::Result<std::string_view, core::EncodeError> encode_into(
    core::Uint128 value, std::span<char> buffer) noexcept;

// decode parses exactly 26 Base32 characters.
// kInvalidLength: text is not 26 characters long.
// kInvalidChar:   a character is outside the alphabet, or the leading character
//                 is above '7' (the value would need more than 128 bits).
[[nodiscard]] core::Result<core::Uint128, core::DecodeError> decode(std::string_view text);

}  // namespace sulid::codec
