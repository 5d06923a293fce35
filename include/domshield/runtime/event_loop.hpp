#pragma once

#include "domshield/runtime/clock.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace domshield::runtime {

using TimerId = std::uint64_t;
using Task = std::function<void()>;

/// Passed to idle callbacks. `time_remaining` is zero for a callback run by its timeout.
struct IdleDeadline {
  Millis time_remaining = 0;
  bool did_timeout = false;
};

using IdleTask = std::function<void(const IdleDeadline &)>;

/// Single-threaded cooperative loop: posted tasks, timers and idle requests. Nothing runs
/// until the host drives it with run_pending, run_until or run_idle_slice.
class EventLoop {
public:
  explicit EventLoop(const Clock &clock);

  [[nodiscard]] const Clock &clock() const { return clock_; }
  [[nodiscard]] Millis now_ms() const { return clock_.now_ms(); }

  void post(Task task);
  TimerId set_timeout(Task task, Millis delay_ms);
  TimerId set_interval(Task task, Millis interval_ms);
  /// Idle request that runs in the next idle slice, or once `timeout_ms` elapses.
  TimerId request_idle(IdleTask task, Millis timeout_ms);
  /// Cancels a timer, interval or idle request. Unknown ids are ignored.
  void clear_timer(TimerId id);

  /// Runs posted tasks and every timer due at the current clock time.
  std::size_t run_pending();
  /// Runs timers in due order up to `deadline_ms`. `set_time` moves the driving clock to each
  /// due time before the timer runs, and to `deadline_ms` at the end.
  std::size_t run_until(Millis deadline_ms, const std::function<void(Millis)> &set_time);
  /// Grants an idle period of `budget_ms` to queued idle requests.
  std::size_t run_idle_slice(Millis budget_ms);

  [[nodiscard]] bool has_pending_work() const;
  [[nodiscard]] std::size_t pending_idle_requests() const { return idle_.size(); }
  [[nodiscard]] std::optional<Millis> next_due_ms() const;

private:
  struct Timer {
    TimerId id = 0;
    Millis due_ms = 0;
    Millis interval_ms = 0;
    Task task;
  };

  struct IdleRequest {
    TimerId id = 0;
    IdleTask task;
    TimerId timeout_timer = 0;
  };

  std::size_t drain_posted();
  std::size_t run_due_timers(Millis now);
  void run_idle_by_timeout(TimerId id);

  const Clock &clock_;
  TimerId next_id_ = 0;
  std::deque<Task> posted_;
  std::map<TimerId, Timer> timers_;
  std::vector<IdleRequest> idle_;
};

} // namespace domshield::runtime
