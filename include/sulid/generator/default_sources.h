#pragma once

#include "sulid/core/clock.h"
#include "sulid/core/random_source.h"

#include <memory>

namespace sulid::generator::detail {

// Default collaborators for SulidGenerator(WorkerIdentity).
// Implemented once per build profile: default_sources_full.cpp returns the
// system clock and a freshly seeded engine; default_sources_minimal.cpp
// returns nullptr for both.
std::unique_ptr<core::IClock> make_default_clock();
std::unique_ptr<core::IRandomSource> make_default_random_source();

}  // namespace sulid::generator::detail
