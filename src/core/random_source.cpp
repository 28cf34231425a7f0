#include "sulid/core/random_source.h"

namespace sulid::core {

Uint128 StepRandomSource::next_u128() {
  const Uint128 value = next_;
  next_ += step_;
  return value;
}

}  // namespace sulid::core
