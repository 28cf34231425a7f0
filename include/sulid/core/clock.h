#pragma once

#include "sulid/core/config.h"

#include <cstdint>

namespace sulid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests and data migrations
// use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return milliseconds since the Unix epoch.
  // May be negative for a clock set before 1970; callers clamp.
  // Contract: safe to call from several threads at once.
  virtual std::int64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

#if SULID_FULL_PROFILE
// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_unix_millis() override;
};
#endif

// Fixed clock: returns a constant timestamp for deterministic tests and backdating.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::int64_t now_unix_millis() override;

 private:
  std::int64_t fixed_millis_;
};

}  // namespace sulid::core
