#pragma once

#include "sulid/core/types.h"

#include <string>

namespace sulid::codec {

// Big-endian conversion: byte 0 holds bits 127..120.
[[nodiscard]] core::ByteArray to_bytes(core::Uint128 value) noexcept;
[[nodiscard]] core::Uint128 from_bytes(const core::ByteArray& bytes) noexcept;

// to_hex returns 32 lower-case hex digits, most significant first.
// Used for diagnostics and JSON where a 128-bit integer has no native form.
[[nodiscard]] std::string to_hex(core::Uint128 value);

}  // namespace sulid::codec
