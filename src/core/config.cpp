#include "sulid/core/config.h"

namespace sulid::core {

std::string build_config_summary() {
  std::string summary;
  summary += kFullProfile ? "profile=full" : "profile=minimal";
  summary += kStrictAssert ? " assert=strict" : " assert=masking";
  summary += kSharedRng ? " rng=shared" : " rng=local";
  return summary;
}

}  // namespace sulid::core
