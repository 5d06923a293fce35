#include "domshield/observability/factory.hpp"

#include "domshield/common/string_util.hpp"

#include <iostream>

namespace domshield::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "log") {
    return std::make_unique<LogObserver>(std::cerr, parse_level(config.observability.level));
  }
  return std::make_unique<NoopObserver>();
}

} // namespace domshield::observability
