#include "domshield/runtime/idle_scheduler.hpp"

namespace domshield::runtime {

IdleScheduler::IdleScheduler(EventLoop &loop, const bool idle_supported)
    : loop_(loop), idle_supported_(idle_supported) {}

TimerId IdleScheduler::schedule(Task task, const Millis idle_timeout_ms,
                                const Millis fallback_delay_ms) {
  if (!idle_supported_) {
    return loop_.set_timeout(std::move(task), fallback_delay_ms);
  }
  return loop_.request_idle(
      [task = std::move(task)](const IdleDeadline &) {
        if (task) {
          task();
        }
      },
      idle_timeout_ms);
}

void IdleScheduler::cancel(const TimerId id) { loop_.clear_timer(id); }

} // namespace domshield::runtime
