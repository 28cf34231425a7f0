#pragma once

#include "sulid/core/config.h"
#include "sulid/core/types.h"

#include <cstdint>
#include <random>

namespace sulid::core {

// Abstract randomness interface for dependency injection.
// Allows production code to draw from a seeded engine while tests use a
// predictable sequence.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Return 128 uniformly distributed bits. Callers mask to the width they need.
  // Not required to be thread-safe; SulidGenerator serializes access.
  virtual Uint128 next_u128() = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

#if SULID_FULL_PROFILE
// Production source: 64-bit Mersenne Twister seeded from std::random_device.
// Not thread-safe; owned by one generator (behind its lock) or one thread.
class SystemRandomSource final : public IRandomSource {
 public:
  SystemRandomSource();
  // Seeded constructor for reproducible runs.
  explicit SystemRandomSource(std::uint64_t seed) : engine_(seed) {}
  ~SystemRandomSource() override = default;

  // Not copyable: two copies would replay the same stream.
  SystemRandomSource(const SystemRandomSource&) = delete;
  SystemRandomSource& operator=(const SystemRandomSource&) = delete;
  SystemRandomSource(SystemRandomSource&&) = default;
  SystemRandomSource& operator=(SystemRandomSource&&) = default;

  Uint128 next_u128() override;

 private:
  std::mt19937_64 engine_;
};
#endif

// Deterministic source: yields start, start + step, start + 2*step, ...
// (wrapping at 2^128). A step of 0 repeats `start` forever.
class StepRandomSource final : public IRandomSource {
 public:
  StepRandomSource(Uint128 start, Uint128 step) : next_(start), step_(step) {}
  ~StepRandomSource() override = default;

  StepRandomSource(const StepRandomSource&) = default;
  StepRandomSource& operator=(const StepRandomSource&) = default;
  StepRandomSource(StepRandomSource&&) = default;
  StepRandomSource& operator=(StepRandomSource&&) = default;

  Uint128 next_u128() override;

 private:
  Uint128 next_;
  Uint128 step_;
};

}  // namespace sulid::core
