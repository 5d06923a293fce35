#pragma once

#include "domshield/runtime/event_loop.hpp"

namespace domshield::runtime {

/// Schedules work for idle time. Without host idle support every request becomes a plain
/// timer of `fallback_delay_ms`.
class IdleScheduler {
public:
  IdleScheduler(EventLoop &loop, bool idle_supported);

  TimerId schedule(Task task, Millis idle_timeout_ms, Millis fallback_delay_ms);
  void cancel(TimerId id);

  [[nodiscard]] bool idle_supported() const { return idle_supported_; }

private:
  EventLoop &loop_;
  bool idle_supported_ = true;
};

} // namespace domshield::runtime
