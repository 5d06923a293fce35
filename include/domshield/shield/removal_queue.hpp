#pragma once

#include "domshield/dom/element.hpp"
#include "domshield/runtime/event_loop.hpp"
#include "domshield/runtime/idle_scheduler.hpp"

#include <cstddef>
#include <deque>

namespace domshield::shield {

class ProcessedSet;

struct RemovalQueueOptions {
  std::size_t batch_size = 50;
  runtime::Millis idle_timeout_ms = 500;
  runtime::Millis fallback_delay_ms = 100;
  runtime::Millis cooldown_ms = 2'000;
};

/// FIFO of suppressed elements waiting to be detached in idle time.
class RemovalQueue {
public:
  RemovalQueue(runtime::EventLoop &loop, runtime::IdleScheduler &idle,
               RemovalQueueOptions options = {}, ProcessedSet *processed = nullptr);
  ~RemovalQueue();

  RemovalQueue(const RemovalQueue &) = delete;
  RemovalQueue &operator=(const RemovalQueue &) = delete;

  void enqueue(const dom::ElementPtr &element);

  /// Starts the drain loop: one batch per idle window, a cooldown sleep whenever empty.
  void start();
  void stop();
  [[nodiscard]] bool running() const { return running_; }

  /// Detaches up to `batch_size` queued elements. Expired or already detached elements
  /// count towards the batch but are skipped. Returns the number dequeued.
  std::size_t drain_batch();

  [[nodiscard]] std::size_t size() const { return queue_.size(); }
  [[nodiscard]] bool empty() const { return queue_.empty(); }
  [[nodiscard]] std::size_t detached_total() const { return detached_total_; }

private:
  void schedule_chunk();
  void on_chunk();

  runtime::EventLoop &loop_;
  runtime::IdleScheduler &idle_;
  RemovalQueueOptions options_;
  ProcessedSet *processed_ = nullptr;
  std::deque<dom::WeakElementPtr> queue_;
  runtime::TimerId scheduled_ = 0;
  bool running_ = false;
  std::size_t detached_total_ = 0;
};

} // namespace domshield::shield
