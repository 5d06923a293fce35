#include "domshield/shield/removal_queue.hpp"

#include "domshield/observability/global.hpp"
#include "domshield/shield/processed_set.hpp"

#include <algorithm>

namespace domshield::shield {

RemovalQueue::RemovalQueue(runtime::EventLoop &loop, runtime::IdleScheduler &idle,
                           RemovalQueueOptions options, ProcessedSet *processed)
    : loop_(loop), idle_(idle), options_(options), processed_(processed) {
  options_.batch_size = std::max<std::size_t>(1, options_.batch_size);
}

RemovalQueue::~RemovalQueue() { stop(); }

void RemovalQueue::enqueue(const dom::ElementPtr &element) {
  if (element) {
    queue_.push_back(element);
  }
}

void RemovalQueue::start() {
  if (running_) {
    return;
  }
  running_ = true;
  schedule_chunk();
}

void RemovalQueue::stop() {
  running_ = false;
  if (scheduled_ != 0) {
    // Idle requests and plain timers share one id space.
    loop_.clear_timer(scheduled_);
    scheduled_ = 0;
  }
}

void RemovalQueue::schedule_chunk() {
  scheduled_ = idle_.schedule([this]() { on_chunk(); }, options_.idle_timeout_ms,
                              options_.fallback_delay_ms);
}

void RemovalQueue::on_chunk() {
  scheduled_ = 0;
  if (!running_) {
    return;
  }
  (void)drain_batch();
  if (!queue_.empty()) {
    schedule_chunk();
    return;
  }
  if (processed_ != nullptr) {
    (void)processed_->prune();
  }
  scheduled_ = loop_.set_timeout(
      [this]() {
        scheduled_ = 0;
        if (running_) {
          schedule_chunk();
        }
      },
      options_.cooldown_ms);
}

std::size_t RemovalQueue::drain_batch() {
  std::size_t processed = 0;
  std::size_t detached = 0;
  while (!queue_.empty() && processed < options_.batch_size) {
    const auto element = queue_.front().lock();
    queue_.pop_front();
    ++processed;
    if (!element || !element->parent()) {
      continue;
    }
    element->remove();
    ++detached;
  }
  detached_total_ += detached;
  if (detached > 0) {
    observability::record_debug("removal", "detached " + std::to_string(detached) + " elements");
  }
  return processed;
}

} // namespace domshield::shield
