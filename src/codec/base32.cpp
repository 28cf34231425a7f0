#include "sulid/codec/base32.h"

#include <cstdint>

namespace sulid::codec {

namespace {

constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr std::uint8_t kNoValue = 0xFF;
constexpr unsigned kBitsPerChar = 5;
constexpr core::Uint128 kCharMask = 0x1F;

// Highest value the leading character may take: 26 * 5 = 130 bits, 2 too many.
constexpr std::uint8_t kMaxLeadingValue = 7;

constexpr std::array<std::uint8_t, 256> build_lookup() {
  std::array<std::uint8_t, 256> lookup{};
  for (auto& entry : lookup) {
    entry = kNoValue;
  }
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    const char ch = kAlphabet[i];
    lookup[static_cast<unsigned char>(ch)] = static_cast<std::uint8_t>(i);
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      lookup[static_cast<unsigned char>(ch + kCaseOffset)] = static_cast<std::uint8_t>(i);
    }
  }
  return lookup;
}

constexpr std::array<std::uint8_t, 256> kLookup = build_lookup();

}  // namespace

void encode(core::Uint128 value, EncodedBuffer& out) noexcept {
  // Fill from the least significant character backwards.
  for (std::size_t i = kEncodedLength; i-- > 0;) {
    out[i] = kAlphabet[static_cast<std::size_t>(value & kCharMask)];
    value >>= kBitsPerChar;
  }
}

core::Result<std::string_view, core::EncodeError> encode_into(const core::Uint128 value,
                                                              const std::span<char> buffer) noexcept {
  using R = core::Result<std::string_view, core::EncodeError>;
  if (buffer.size() < kEncodedLength) {
    return R::err(core::EncodeError::kBufferTooSmall);
  }

  EncodedBuffer encoded{};
  encode(value, encoded);
  for (std::size_t i = 0; i < kEncodedLength; ++i) {
    buffer[i] = encoded[i];
  }
  return R::ok(std::string_view(buffer.data(), kEncodedLength));
}

core::Result<core::Uint128, core::DecodeError> decode(const std::string_view text) {
  using R = core::Result<core::Uint128, core::DecodeError>;
  if (text.size() != kEncodedLength) {
    return R::err(core::DecodeError::kInvalidLength);
  }

  core::Uint128 value = 0;
  for (std::size_t i = 0; i < kEncodedLength; ++i) {
    const std::uint8_t digit = kLookup[static_cast<unsigned char>(text[i])];
    if (digit == kNoValue) {
      return R::err(core::DecodeError::kInvalidChar);
    }
    if (i == 0 && digit > kMaxLeadingValue) {
      return R::err(core::DecodeError::kInvalidChar);
    }
    value = (value << kBitsPerChar) | digit;
  }
  return R::ok(value);
}

}  // namespace sulid::codec
