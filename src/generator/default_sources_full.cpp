#include "sulid/generator/default_sources.h"

namespace sulid::generator::detail {

std::unique_ptr<core::IClock> make_default_clock() {
  return std::make_unique<core::SystemClock>();
}

std::unique_ptr<core::IRandomSource> make_default_random_source() {
  return std::make_unique<core::SystemRandomSource>();
}

}  // namespace sulid::generator::detail
