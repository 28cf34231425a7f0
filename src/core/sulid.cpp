#include "sulid/core/sulid.h"

#include "sulid/codec/bytes.h"

#include <stdexcept>

namespace sulid::core {

std::string sulid_version_to_string(const SulidVersion v) {
  switch (v) {
    case SulidVersion::kV1:
      return "v1";
    case SulidVersion::kV2:
      return "v2";
  }
  return "unknown";
}

SulidVersion sulid_version_from_string(const std::string& s) {
  if (s == "v1")
    return SulidVersion::kV1;
  if (s == "v2")
    return SulidVersion::kV2;
  throw std::invalid_argument("Unknown SulidVersion: " + s);
}

namespace {

// Shared packing step: the identity has already been reduced to its 10 bits.
Uint128 pack(const std::uint64_t timestamp_ms, const Uint128 random, const Uint128 identity) {
  const Uint128 time_part = timestamp_ms & Sulid::kMaxTimestampMs;
  const Uint128 rand_part = random & Sulid::kMaxRandom;
  return (time_part << (Sulid::kRandomBits + Sulid::kWorkerBits)) |
         (rand_part << Sulid::kWorkerBits) | identity;
}

void check_time_and_random(const std::uint64_t timestamp_ms, const Uint128 random) {
  if constexpr (kStrictAssert) {
    require(timestamp_ms <= Sulid::kMaxTimestampMs,
            "timestamp_ms must be in the range 0-281474976710655");
    require(random <= Sulid::kMaxRandom, "random must be in the range 0-1180591620717411303423");
  }
}

}  // namespace

Sulid Sulid::from_parts(const std::uint64_t timestamp_ms, const Uint128 random,
                        const std::uint8_t data_center_id, const std::uint8_t machine_id) {
  check_time_and_random(timestamp_ms, random);
  if constexpr (kStrictAssert) {
    require(data_center_id <= kMaxDataCenterId, "data_center_id must be in the range 0-31");
    require(machine_id <= kMaxMachineId, "machine_id must be in the range 0-31");
  }

  const Uint128 data_center_part = data_center_id & kMaxDataCenterId;
  const Uint128 machine_part = machine_id & kMaxMachineId;
  return Sulid(pack(timestamp_ms, random, (data_center_part << kMachineBits) | machine_part));
}

Sulid Sulid::from_parts(const SulidV1Parts& parts) {
  return from_parts(parts.timestamp_ms, parts.random, parts.data_center_id, parts.machine_id);
}

Sulid Sulid::from_parts_v2(const std::uint64_t timestamp_ms, const Uint128 random,
                           const std::uint16_t worker_id) {
  check_time_and_random(timestamp_ms, random);
  if constexpr (kStrictAssert) {
    require(worker_id <= kMaxWorkerId, "worker_id must be in the range 0-1023");
  }

  return Sulid(pack(timestamp_ms, random, worker_id & kMaxWorkerId));
}

Sulid Sulid::from_parts(const SulidV2Parts& parts) {
  return from_parts_v2(parts.timestamp_ms, parts.random, parts.worker_id);
}

Sulid Sulid::from_bytes(const ByteArray& bytes) noexcept {
  return Sulid(codec::from_bytes(bytes));
}

Result<Sulid, DecodeError> Sulid::from_string(const std::string_view encoded) {
  const auto decoded = codec::decode(encoded);
  if (!decoded.has_value()) {
    return Result<Sulid, DecodeError>::err(decoded.error());
  }
  return Result<Sulid, DecodeError>::ok(Sulid(decoded.value()));
}

std::optional<Sulid> Sulid::increment() const noexcept {
  if (random() == kMaxRandom) {
    return std::nullopt;
  }
  // Adding one at the random field's lowest bit cannot carry into the
  // timestamp because the field is not saturated.
  return Sulid(value_ + (Uint128{1} << kWorkerBits));
}

ByteArray Sulid::to_bytes() const noexcept {
  return codec::to_bytes(value_);
}

SulidV1Parts Sulid::to_parts() const noexcept {
  return SulidV1Parts{
      .timestamp_ms = timestamp_ms(),
      .random = random(),
      .data_center_id = data_center_id(),
      .machine_id = machine_id(),
  };
}

SulidV2Parts Sulid::to_parts_v2() const noexcept {
  return SulidV2Parts{
      .timestamp_ms = timestamp_ms(),
      .random = random(),
      .worker_id = worker_id(),
  };
}

std::string_view Sulid::encode_into(codec::EncodedBuffer& buffer) const noexcept {
  codec::encode(value_, buffer);
  return std::string_view(buffer.data(), buffer.size());
}

Result<std::string_view, EncodeError> Sulid::encode_into(std::span<char> buffer) const noexcept {
  return codec::encode_into(value_, buffer);
}

}  // namespace sulid::core
