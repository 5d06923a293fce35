#pragma once

#include "domshield/config/config.hpp"
#include "domshield/observability/observer.hpp"

#include <memory>

namespace domshield::observability {

/// Build the observer selected by `observability.backend` ("log" or "none").
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace domshield::observability
