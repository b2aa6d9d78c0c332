#pragma once

#include "wiredrive/config/schema.hpp"
#include "wiredrive/observability/observer.hpp"

#include <memory>

namespace wiredrive::observability {

[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

/// Shared no-op sink used wherever a component was given no observer.
[[nodiscard]] std::shared_ptr<IObserver> noop_observer();

} // namespace wiredrive::observability
