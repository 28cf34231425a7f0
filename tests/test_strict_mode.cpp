#include "sulid/core/config.h"
#include "sulid/core/result.h"
#include "sulid/core/sulid.h"

#include <catch2/catch.hpp>

#include <string>

using namespace sulid::core;

static std::string violation_message(void (*fn)()) {
  try {
    fn();
  } catch (const PreconditionViolation& e) {
    return e.what();
  }
  return "";
}

TEST_CASE("strict build reports its switches", "[strict]") {
  STATIC_REQUIRE(kStrictAssert);
  CHECK(build_config_summary() == "profile=full assert=strict rng=shared");
}

TEST_CASE("strict from_parts rejects out-of-range fields", "[strict]") {
  SECTION("data center id") {
    CHECK(violation_message([] { (void)Sulid::from_parts(1, 1, 32, 0); }) ==
          "data_center_id must be in the range 0-31");
  }

  SECTION("machine id") {
    CHECK(violation_message([] { (void)Sulid::from_parts(1, 1, 0, 32); }) ==
          "machine_id must be in the range 0-31");
  }

  SECTION("timestamp") {
    CHECK(violation_message([] {
            (void)Sulid::from_parts(Sulid::kMaxTimestampMs + 1, 1, 0, 0);
          }) == "timestamp_ms must be in the range 0-281474976710655");
  }

  SECTION("random") {
    CHECK(violation_message([] {
            (void)Sulid::from_parts(1, Sulid::kMaxRandom + 1, 0, 0);
          }) == "random must be in the range 0-1180591620717411303423");
  }

  SECTION("worker id") {
    CHECK(violation_message([] { (void)Sulid::from_parts_v2(1, 1, 1024); }) ==
          "worker_id must be in the range 0-1023");
  }
}

TEST_CASE("strict from_parts accepts boundary values", "[strict]") {
  const Sulid id = Sulid::from_parts(Sulid::kMaxTimestampMs, Sulid::kMaxRandom,
                                     Sulid::kMaxDataCenterId, Sulid::kMaxMachineId);
  CHECK(id.to_string() == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
  CHECK(Sulid::from_parts(1, 1, 1, 1).to_string() == "00000000010000000000000111");
}
