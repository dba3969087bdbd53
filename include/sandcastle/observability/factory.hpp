#pragma once

#include "sandcastle/config/schema.hpp"
#include "sandcastle/observability/observer.hpp"

#include <memory>

namespace sandcastle::observability {

/// `log`, `noop`/`none`, or a comma list of those. Unknown names fall back to `log`.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sandcastle::observability
