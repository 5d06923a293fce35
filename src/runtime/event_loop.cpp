#include "domshield/runtime/event_loop.hpp"

#include <algorithm>

namespace domshield::runtime {

EventLoop::EventLoop(const Clock &clock) : clock_(clock) {}

void EventLoop::post(Task task) {
  if (task) {
    posted_.push_back(std::move(task));
  }
}

TimerId EventLoop::set_timeout(Task task, const Millis delay_ms) {
  const TimerId id = ++next_id_;
  timers_[id] = Timer{id, clock_.now_ms() + std::max<Millis>(0, delay_ms), 0, std::move(task)};
  return id;
}

TimerId EventLoop::set_interval(Task task, const Millis interval_ms) {
  const TimerId id = ++next_id_;
  const Millis interval = std::max<Millis>(1, interval_ms);
  timers_[id] = Timer{id, clock_.now_ms() + interval, interval, std::move(task)};
  return id;
}

TimerId EventLoop::request_idle(IdleTask task, const Millis timeout_ms) {
  const TimerId id = ++next_id_;
  IdleRequest request;
  request.id = id;
  request.task = std::move(task);
  request.timeout_timer = set_timeout([this, id]() { run_idle_by_timeout(id); }, timeout_ms);
  idle_.push_back(std::move(request));
  return id;
}

void EventLoop::clear_timer(const TimerId id) {
  if (timers_.erase(id) > 0) {
    return;
  }
  const auto it = std::find_if(idle_.begin(), idle_.end(),
                               [id](const IdleRequest &request) { return request.id == id; });
  if (it != idle_.end()) {
    timers_.erase(it->timeout_timer);
    idle_.erase(it);
  }
}

void EventLoop::run_idle_by_timeout(const TimerId id) {
  const auto it = std::find_if(idle_.begin(), idle_.end(),
                               [id](const IdleRequest &request) { return request.id == id; });
  if (it == idle_.end()) {
    return;
  }
  IdleTask task = std::move(it->task);
  idle_.erase(it);
  if (task) {
    task(IdleDeadline{0, true});
  }
}

std::size_t EventLoop::drain_posted() {
  std::size_t ran = 0;
  while (!posted_.empty()) {
    Task task = std::move(posted_.front());
    posted_.pop_front();
    task();
    ++ran;
  }
  return ran;
}

std::size_t EventLoop::run_due_timers(const Millis now) {
  std::size_t ran = 0;
  while (true) {
    auto next = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (it->second.due_ms <= now &&
          (next == timers_.end() || it->second.due_ms < next->second.due_ms)) {
        next = it;
      }
    }
    if (next == timers_.end()) {
      return ran;
    }

    Task task;
    if (next->second.interval_ms > 0) {
      next->second.due_ms += next->second.interval_ms;
      task = next->second.task;
    } else {
      task = std::move(next->second.task);
      timers_.erase(next);
    }
    if (task) {
      task();
    }
    ++ran;
    ran += drain_posted();
  }
}

std::size_t EventLoop::run_pending() {
  std::size_t ran = drain_posted();
  ran += run_due_timers(clock_.now_ms());
  return ran;
}

std::size_t EventLoop::run_until(const Millis deadline_ms,
                                 const std::function<void(Millis)> &set_time) {
  std::size_t ran = 0;
  while (true) {
    ran += drain_posted();
    const auto due = next_due_ms();
    if (!due.has_value() || *due > deadline_ms) {
      break;
    }
    if (set_time && *due > clock_.now_ms()) {
      set_time(*due);
    }
    ran += run_due_timers(*due);
  }
  if (set_time) {
    set_time(deadline_ms);
  }
  ran += drain_posted();
  return ran;
}

std::size_t EventLoop::run_idle_slice(const Millis budget_ms) {
  std::size_t ran = drain_posted();
  std::vector<TimerId> ids;
  ids.reserve(idle_.size());
  for (const auto &request : idle_) {
    ids.push_back(request.id);
  }

  const Millis start = clock_.now_ms();
  for (const TimerId id : ids) {
    const Millis elapsed = clock_.now_ms() - start;
    if (elapsed >= budget_ms) {
      break;
    }
    const auto it = std::find_if(idle_.begin(), idle_.end(),
                                 [id](const IdleRequest &request) { return request.id == id; });
    if (it == idle_.end()) {
      continue;
    }
    IdleTask task = std::move(it->task);
    timers_.erase(it->timeout_timer);
    idle_.erase(it);
    if (task) {
      task(IdleDeadline{budget_ms - elapsed, false});
    }
    ++ran;
    ran += drain_posted();
  }
  return ran;
}

bool EventLoop::has_pending_work() const {
  return !posted_.empty() || !timers_.empty() || !idle_.empty();
}

std::optional<Millis> EventLoop::next_due_ms() const {
  if (!posted_.empty()) {
    return clock_.now_ms();
  }
  std::optional<Millis> out;
  for (const auto &[id, timer] : timers_) {
    if (!out.has_value() || timer.due_ms < *out) {
      out = timer.due_ms;
    }
  }
  return out;
}

} // namespace domshield::runtime
