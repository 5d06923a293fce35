#include "domshield/observability/global.hpp"

#include <mutex>

namespace domshield::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

NoopObserver &noop_observer() {
  static NoopObserver observer;
  return observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver &global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (!g_observer) {
    return noop_observer();
  }
  return *g_observer;
}

void record_debug(std::string_view component, std::string_view message) {
  global_observer().record(Level::Debug, component, message);
}

void record_event(std::string_view component, std::string_view message) {
  global_observer().record(Level::Info, component, message);
}

void record_error(std::string_view component, std::string_view message) {
  global_observer().record(Level::Error, component, message);
}

} // namespace domshield::observability
