#pragma once

#include "domshield/observability/observer.hpp"

#include <memory>
#include <string_view>

namespace domshield::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] IObserver &global_observer();

void record_debug(std::string_view component, std::string_view message);
void record_event(std::string_view component, std::string_view message);
void record_error(std::string_view component, std::string_view message);

} // namespace domshield::observability
