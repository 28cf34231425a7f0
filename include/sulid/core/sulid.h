#pragma once

#include "sulid/codec/base32.h"
#include "sulid/core/config.h"
#include "sulid/core/result.h"
#include "sulid/core/types.h"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#if SULID_FULL_PROFILE
#include "sulid/core/random_source.h"
#include "sulid/core/time.h"

#include <iosfwd>
#endif

namespace sulid::core {

// SulidVersion selects how the low 10 bits are read.
// kV1: | 48 timestamp | 70 random | 5 data center | 5 machine |
// kV2: | 48 timestamp | 70 random | 10 worker                 |
// The packed value is identical for both; a V2 worker id equals
// (data_center_id << 5) | machine_id of the same bits.
enum class SulidVersion { kV1, kV2 };

// Version string conversion helpers ("v1", "v2").
// sulid_version_from_string throws std::invalid_argument for unknown values.
std::string sulid_version_to_string(SulidVersion v);
SulidVersion sulid_version_from_string(const std::string& s);

// Parts of a V1 identifier, in field order.
struct SulidV1Parts {
  std::uint64_t timestamp_ms{0};   // NOLINT(readability-identifier-naming)
  Uint128 random{0};               // NOLINT(readability-identifier-naming)
  std::uint8_t data_center_id{0};  // NOLINT(readability-identifier-naming)
  std::uint8_t machine_id{0};      // NOLINT(readability-identifier-naming)

  bool operator==(const SulidV1Parts&) const = default;
};

// Parts of a V2 identifier, in field order.
struct SulidV2Parts {
  std::uint64_t timestamp_ms{0};  // NOLINT(readability-identifier-naming)
  Uint128 random{0};              // NOLINT(readability-identifier-naming)
  std::uint16_t worker_id{0};     // NOLINT(readability-identifier-naming)

  bool operator==(const SulidV2Parts&) const = default;
};

// Sulid is an immutable 128-bit identifier that sorts by creation time.
//
// Ordering and equality are those of the packed unsigned integer, which is
// also the lexicographic order of the 26-character Base32 text.
// Every projection is a shift-and-mask over the stored value.
//
// Construction from parts masks each field to its width. With
// SULID_STRICT_ASSERT, an out-of-range field throws PreconditionViolation
// instead.
class Sulid {
 public:
  static constexpr unsigned kTimeBits = 48;
  static constexpr unsigned kRandomBits = 70;
  static constexpr unsigned kDataCenterBits = 5;
  static constexpr unsigned kMachineBits = 5;
  static constexpr unsigned kWorkerBits = kDataCenterBits + kMachineBits;
  static_assert(kTimeBits + kRandomBits + kWorkerBits == 128, "layout must fill 128 bits");

  static constexpr std::uint64_t kMaxTimestampMs = (std::uint64_t{1} << kTimeBits) - 1;
  static constexpr Uint128 kMaxRandom = bitmask(kRandomBits);
  static constexpr std::uint8_t kMaxDataCenterId = (1u << kDataCenterBits) - 1;
  static constexpr std::uint8_t kMaxMachineId = (1u << kMachineBits) - 1;
  static constexpr std::uint16_t kMaxWorkerId = (1u << kWorkerBits) - 1;

  // Default-constructed Sulid is nil.
  constexpr Sulid() = default;

  // The nil Sulid has all 128 bits zero.
  static constexpr Sulid nil() noexcept { return Sulid{}; }

  static constexpr Sulid from_u128(const Uint128 value) noexcept { return Sulid(value); }

  static Sulid from_parts(std::uint64_t timestamp_ms, Uint128 random, std::uint8_t data_center_id,
                          std::uint8_t machine_id);
  static Sulid from_parts(const SulidV1Parts& parts);

  static Sulid from_parts_v2(std::uint64_t timestamp_ms, Uint128 random, std::uint16_t worker_id);
  static Sulid from_parts(const SulidV2Parts& parts);

  static Sulid from_bytes(const ByteArray& bytes) noexcept;

  // from_string decodes the 26-character Base32 form.
  // Fails with kInvalidLength or kInvalidChar; never yields a partial value.
  static Result<Sulid, DecodeError> from_string(std::string_view encoded);

  [[nodiscard]] constexpr Uint128 to_u128() const noexcept { return value_; }

  [[nodiscard]] constexpr std::uint64_t timestamp_ms() const noexcept {
    return static_cast<std::uint64_t>(value_ >> (kRandomBits + kWorkerBits));
  }

  [[nodiscard]] constexpr Uint128 random() const noexcept {
    return (value_ >> kWorkerBits) & kMaxRandom;
  }

  [[nodiscard]] constexpr std::uint8_t data_center_id() const noexcept {
    return static_cast<std::uint8_t>((value_ >> kMachineBits) & bitmask(kDataCenterBits));
  }

  [[nodiscard]] constexpr std::uint8_t machine_id() const noexcept {
    return static_cast<std::uint8_t>(value_ & bitmask(kMachineBits));
  }

  [[nodiscard]] constexpr std::uint16_t worker_id() const noexcept {
    return static_cast<std::uint16_t>(value_ & bitmask(kWorkerBits));
  }

  [[nodiscard]] constexpr bool is_nil() const noexcept { return value_ == 0; }

  // increment returns the identifier whose random field is one greater.
  // Timestamp and identity bits are unchanged.
  // Returns nullopt when the random field is already all ones.
  [[nodiscard]] std::optional<Sulid> increment() const noexcept;

  [[nodiscard]] ByteArray to_bytes() const noexcept;
  [[nodiscard]] SulidV1Parts to_parts() const noexcept;
  [[nodiscard]] SulidV2Parts to_parts_v2() const noexcept;

  // Encode into a caller-owned buffer without allocating.
  // The returned view points into buffer.
  std::string_view encode_into(codec::EncodedBuffer& buffer) const noexcept;
  [[nodiscard]] Result<std::string_view, EncodeError> encode_into(
      std::span<char> buffer) const noexcept;

#if SULID_FULL_PROFILE
  // from_datetime builds an identifier for the given instant with fresh
  // randomness from a per-thread source. Instants before the epoch clamp to 0.
  // Useful for migrating existing records into this id scheme.
  static Sulid from_datetime(Timestamp datetime, std::uint8_t data_center_id,
                             std::uint8_t machine_id);
  static Sulid from_datetime_with_source(Timestamp datetime, IRandomSource& source,
                                         std::uint8_t data_center_id, std::uint8_t machine_id);

  // datetime returns the embedded timestamp, accurate to 1ms.
  [[nodiscard]] Timestamp datetime() const;

  [[nodiscard]] std::string to_string() const;
#endif

  friend constexpr bool operator==(const Sulid& a, const Sulid& b) noexcept {
    return a.value_ == b.value_;
  }

  friend constexpr std::strong_ordering operator<=>(const Sulid& a, const Sulid& b) noexcept {
    if (a.value_ < b.value_) {
      return std::strong_ordering::less;
    }
    if (a.value_ > b.value_) {
      return std::strong_ordering::greater;
    }
    return std::strong_ordering::equal;
  }

 private:
  constexpr explicit Sulid(const Uint128 value) noexcept : value_(value) {}

  Uint128 value_{0};
};

#if SULID_FULL_PROFILE
std::ostream& operator<<(std::ostream& os, const Sulid& id);
#endif

}  // namespace sulid::core

template <>
struct std::hash<sulid::core::Sulid> {
  std::size_t operator()(const sulid::core::Sulid& id) const noexcept {
    const sulid::core::Uint128 v = id.to_u128();
    const auto high = static_cast<std::uint64_t>(v >> 64);
    const auto low = static_cast<std::uint64_t>(v);
    // boost::hash_combine mixing step.
    std::size_t seed = std::hash<std::uint64_t>{}(high);
    seed ^= std::hash<std::uint64_t>{}(low) + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
    return seed;
  }
};
