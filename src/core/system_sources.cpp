#include "sulid/core/clock.h"
#include "sulid/core/random_source.h"
#include "sulid/core/time.h"

#include <array>
#include <cstdint>

namespace sulid::core {

std::int64_t SystemClock::now_unix_millis() {
  return to_unix_millis(Clock::now());
}

namespace {

std::mt19937_64 make_seeded_engine() {
  // Seed the whole engine state, not just 32 bits of it.
  std::random_device rd;
  std::array<std::uint32_t, 8> seed_data{};
  for (auto& word : seed_data) {
    word = rd();
  }
  std::seed_seq seq(seed_data.begin(), seed_data.end());
  return std::mt19937_64(seq);
}

}  // namespace

SystemRandomSource::SystemRandomSource() : engine_(make_seeded_engine()) {}

Uint128 SystemRandomSource::next_u128() {
  // Two 64-bit samples make one 128-bit value.
  const Uint128 high = engine_();
  const Uint128 low = engine_();
  return (high << 64) | low;
}

}  // namespace sulid::core
