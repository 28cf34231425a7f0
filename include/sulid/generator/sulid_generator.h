#pragma once

#include "sulid/core/clock.h"
#include "sulid/core/config.h"
#include "sulid/core/random_source.h"
#include "sulid/core/sulid.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <type_traits>
#include <variant>

namespace sulid::generator {

// V1Identity: 5-bit data center id + 5-bit machine id.
struct V1Identity {
  std::uint8_t data_center_id{0};  // NOLINT(readability-identifier-naming)
  std::uint8_t machine_id{0};      // NOLINT(readability-identifier-naming)
};

// V2Identity: a single 10-bit worker id.
struct V2Identity {
  std::uint16_t worker_id{0};  // NOLINT(readability-identifier-naming)
};

// WorkerIdentity is fixed for a generator's lifetime; its alternative decides
// the layout (SulidVersion) of everything the generator produces.
using WorkerIdentity = std::variant<V1Identity, V2Identity>;

// validate_identity throws core::PreconditionViolation when a field exceeds
// its bit width (data center / machine > 31, worker > 1023).
void validate_identity(const WorkerIdentity& identity);

[[nodiscard]] core::SulidVersion version_of(const WorkerIdentity& identity) noexcept;

namespace detail {

// NullMutex satisfies Lockable without synchronizing anything.
struct NullMutex {
  void lock() noexcept {}
  void unlock() noexcept {}
  bool try_lock() noexcept { return true; }
};

}  // namespace detail

// RandomSourceMutex guards a generator's randomness source.
// SULID_SHARED_RNG=0 selects the no-op lock for single-threaded builds.
using RandomSourceMutex = std::conditional_t<core::kSharedRng, std::mutex, detail::NullMutex>;

// SulidGenerator produces identifiers from a clock, a randomness source and a
// fixed worker identity.
//
// Thread-safety: generate() and generate_at() may be called concurrently.
// The clock is read outside the lock; only the draw from the owned randomness
// source is serialized (see SULID_SHARED_RNG).
//
// Uniqueness is probabilistic: the generator keeps no history, so two calls in
// the same millisecond differ only by their 70 random bits. Use
// Sulid::increment() to build a strictly increasing sequence.
class SulidGenerator {
 public:
  // Uses the build profile's default clock and randomness source.
  // Full profile: SystemClock + SystemRandomSource.
  // Minimal profile: none; only compose() and generate_*_with() may be used.
  explicit SulidGenerator(WorkerIdentity identity);

  // Injected clock and randomness source; neither may be null.
  SulidGenerator(WorkerIdentity identity, std::unique_ptr<core::IClock> clock,
                 std::unique_ptr<core::IRandomSource> source);

  ~SulidGenerator() = default;

  // Not copyable or movable (owns a mutex-guarded source)
  SulidGenerator(const SulidGenerator&) = delete;
  SulidGenerator& operator=(const SulidGenerator&) = delete;
  SulidGenerator(SulidGenerator&&) = delete;
  SulidGenerator& operator=(SulidGenerator&&) = delete;

  // v1 / v2 build a generator with the default clock and source.
  // Throw core::PreconditionViolation for out-of-range ids.
  static SulidGenerator v1(std::uint8_t data_center_id, std::uint8_t machine_id);
  static SulidGenerator v2(std::uint16_t worker_id);

  // generate reads the clock, draws 70 random bits and packs them with the
  // generator's identity. Clock readings before the epoch clamp to 0.
  [[nodiscard]] core::Sulid generate();

  // generate_at uses the given Unix time instead of the clock, for tests and
  // for backdating ids of migrated records.
  [[nodiscard]] core::Sulid generate_at(std::int64_t unix_ms);

  // Variants drawing from a caller-owned source. The caller's source is not
  // locked; it must not be shared across threads.
  [[nodiscard]] core::Sulid generate_with(core::IRandomSource& source);
  [[nodiscard]] core::Sulid generate_at_with(std::int64_t unix_ms,
                                             core::IRandomSource& source) const;

  // compose packs explicit inputs with this generator's identity.
  // Pure; needs neither clock nor source.
  [[nodiscard]] core::Sulid compose(std::uint64_t timestamp_ms, core::Uint128 random) const;

  [[nodiscard]] core::SulidVersion version() const noexcept { return version_of(identity_); }
  [[nodiscard]] const WorkerIdentity& identity() const noexcept { return identity_; }

 private:
  [[nodiscard]] std::int64_t read_clock();
  [[nodiscard]] core::Uint128 draw_random();

  WorkerIdentity identity_;
  std::unique_ptr<core::IClock> clock_;
  std::unique_ptr<core::IRandomSource> source_;
  RandomSourceMutex source_mutex_;
};

}  // namespace sulid::generator
