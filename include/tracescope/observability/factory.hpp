#pragma once

#include "tracescope/config/schema.hpp"
#include "tracescope/observability/observer.hpp"

#include <memory>

namespace tracescope::observability {

/// Builds the observer named by `observability.backend`: `log`, `stats`, or a comma list of
/// them. `none` and `noop` entries contribute nothing; a backend with no live entry yields
/// nullptr. `verbose` lowers the log threshold to debug.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                                         bool verbose = false);

} // namespace tracescope::observability
