#include "sulid/generator/sulid_generator.h"

#include "sulid/core/time.h"
#include "sulid/generator/default_sources.h"

#include <utility>

namespace sulid::generator {

namespace {

// Overload set for std::visit.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

void validate_identity(const WorkerIdentity& identity) {
  std::visit(Overloaded{
                 [](const V1Identity& id) {
                   core::require(id.data_center_id <= core::Sulid::kMaxDataCenterId,
                                 "data_center_id must be in the range 0-31");
                   core::require(id.machine_id <= core::Sulid::kMaxMachineId,
                                 "machine_id must be in the range 0-31");
                 },
                 [](const V2Identity& id) {
                   core::require(id.worker_id <= core::Sulid::kMaxWorkerId,
                                 "worker_id must be in the range 0-1023");
                 },
             },
             identity);
}

core::SulidVersion version_of(const WorkerIdentity& identity) noexcept {
  return std::holds_alternative<V1Identity>(identity) ? core::SulidVersion::kV1
                                                      : core::SulidVersion::kV2;
}

SulidGenerator::SulidGenerator(WorkerIdentity identity)
    : identity_(identity),
      clock_(detail::make_default_clock()),
      source_(detail::make_default_random_source()) {
  validate_identity(identity_);
}

SulidGenerator::SulidGenerator(WorkerIdentity identity, std::unique_ptr<core::IClock> clock,
                               std::unique_ptr<core::IRandomSource> source)
    : identity_(identity), clock_(std::move(clock)), source_(std::move(source)) {
  validate_identity(identity_);
  core::require(clock_ != nullptr, "clock must not be null");
  core::require(source_ != nullptr, "random source must not be null");
}

SulidGenerator SulidGenerator::v1(const std::uint8_t data_center_id,
                                  const std::uint8_t machine_id) {
  return SulidGenerator(V1Identity{.data_center_id = data_center_id, .machine_id = machine_id});
}

SulidGenerator SulidGenerator::v2(const std::uint16_t worker_id) {
  return SulidGenerator(V2Identity{.worker_id = worker_id});
}

core::Sulid SulidGenerator::generate() {
  const std::int64_t now = read_clock();
  return compose(core::clamp_to_epoch(now) & core::Sulid::kMaxTimestampMs, draw_random());
}

core::Sulid SulidGenerator::generate_at(const std::int64_t unix_ms) {
  return compose(core::clamp_to_epoch(unix_ms) & core::Sulid::kMaxTimestampMs, draw_random());
}

core::Sulid SulidGenerator::generate_with(core::IRandomSource& source) {
  return generate_at_with(read_clock(), source);
}

core::Sulid SulidGenerator::generate_at_with(const std::int64_t unix_ms,
                                             core::IRandomSource& source) const {
  return compose(core::clamp_to_epoch(unix_ms) & core::Sulid::kMaxTimestampMs,
                 source.next_u128() & core::Sulid::kMaxRandom);
}

core::Sulid SulidGenerator::compose(const std::uint64_t timestamp_ms,
                                    const core::Uint128 random) const {
  return std::visit(Overloaded{
                        [&](const V1Identity& id) {
                          return core::Sulid::from_parts(timestamp_ms, random, id.data_center_id,
                                                         id.machine_id);
                        },
                        [&](const V2Identity& id) {
                          return core::Sulid::from_parts_v2(timestamp_ms, random, id.worker_id);
                        },
                    },
                    identity_);
}

std::int64_t SulidGenerator::read_clock() {
  core::require(clock_ != nullptr,
                "generator has no clock; inject one or use generate_at_with()/compose()");
  return clock_->now_unix_millis();
}

core::Uint128 SulidGenerator::draw_random() {
  core::require(source_ != nullptr,
                "generator has no random source; inject one or use generate_at_with()/compose()");
  std::lock_guard<RandomSourceMutex> lock(source_mutex_);
  return source_->next_u128() & core::Sulid::kMaxRandom;
}

}  // namespace sulid::generator
