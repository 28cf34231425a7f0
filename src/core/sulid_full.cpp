#include "sulid/core/sulid.h"

#include <ostream>

namespace sulid::core {

Sulid Sulid::from_datetime(const Timestamp datetime, const std::uint8_t data_center_id,
                           const std::uint8_t machine_id) {
  // One source per thread: no locking, no shared engine state.
  static thread_local SystemRandomSource source;
  return from_datetime_with_source(datetime, source, data_center_id, machine_id);
}

Sulid Sulid::from_datetime_with_source(const Timestamp datetime, IRandomSource& source,
                                       const std::uint8_t data_center_id,
                                       const std::uint8_t machine_id) {
  const std::uint64_t time_bits = clamp_to_epoch(to_unix_millis(datetime)) & kMaxTimestampMs;
  const Uint128 rand_bits = source.next_u128() & kMaxRandom;
  return from_parts(time_bits, rand_bits, data_center_id, machine_id);
}

Timestamp Sulid::datetime() const {
  return from_unix_millis(timestamp_ms());
}

std::string Sulid::to_string() const {
  codec::EncodedBuffer buffer{};
  return std::string(encode_into(buffer));
}

std::ostream& operator<<(std::ostream& os, const Sulid& id) {
  codec::EncodedBuffer buffer{};
  return os << id.encode_into(buffer);
}

}  // namespace sulid::core
