#include "sulid/codec/bytes.h"

namespace sulid::codec {

core::ByteArray to_bytes(core::Uint128 value) noexcept {
  core::ByteArray bytes{};
  for (std::size_t i = core::kByteLength; i-- > 0;) {
    bytes[i] = static_cast<std::uint8_t>(value & 0xFF);
    value >>= 8;
  }
  return bytes;
}

core::Uint128 from_bytes(const core::ByteArray& bytes) noexcept {
  core::Uint128 value = 0;
  for (const std::uint8_t b : bytes) {
    value = (value << 8) | b;
  }
  return value;
}

std::string to_hex(core::Uint128 value) {
  constexpr char kHexDigits[] = "0123456789abcdef";
  std::string out(32, '0');
  for (std::size_t i = out.size(); i-- > 0;) {
    out[i] = kHexDigits[static_cast<std::size_t>(value & 0xF)];
    value >>= 4;
  }
  return out;
}

}  // namespace sulid::codec
