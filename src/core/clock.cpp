#include "sulid/core/clock.h"

namespace sulid::core {

std::int64_t FixedClock::now_unix_millis() {
  return fixed_millis_;
}

}  // namespace sulid::core
