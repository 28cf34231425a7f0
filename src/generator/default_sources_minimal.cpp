#include "sulid/generator/default_sources.h"

namespace sulid::generator::detail {

// No system clock or process randomness in the minimal profile.

std::unique_ptr<core::IClock> make_default_clock() {
  return nullptr;
}

std::unique_ptr<core::IRandomSource> make_default_random_source() {
  return nullptr;
}

}  // namespace sulid::generator::detail
