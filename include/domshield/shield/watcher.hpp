#pragma once

#include "domshield/dom/document.hpp"
#include "domshield/runtime/page.hpp"
#include "domshield/shield/classifier.hpp"
#include "domshield/shield/suppressor.hpp"

#include <memory>
#include <vector>

namespace domshield::shield {

struct WatcherOptions {
  runtime::Millis idle_timeout_ms = 200;
  runtime::Millis fallback_delay_ms = 50;
  /// Merge batches that arrive while a pass is pending instead of dropping them.
  bool merge_pending_batches = false;
};

/// Observes insertions and marker attribute writes under the document element. Marked
/// elements are escalated synchronously; everything else waits for one deferred pass.
class MutationWatcher {
public:
  enum class State { Idle, Collecting, Deferred };

  MutationWatcher(runtime::Page &page, BudgetedClassifier &classifier, Counters &counters,
                  WatcherOptions options = {});
  ~MutationWatcher();

  MutationWatcher(const MutationWatcher &) = delete;
  MutationWatcher &operator=(const MutationWatcher &) = delete;

  void start();
  void stop();

  void handle_mutations(const std::vector<dom::MutationRecord> &records);

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] bool pass_pending() const { return state_ == State::Deferred; }
  [[nodiscard]] std::size_t pending_candidates() const { return pending_.size(); }
  [[nodiscard]] std::size_t dropped_batches() const { return dropped_batches_; }
  [[nodiscard]] const PassResult &last_pass() const { return last_pass_; }

private:
  void run_deferred_pass();

  runtime::Page &page_;
  BudgetedClassifier &classifier_;
  Counters &counters_;
  WatcherOptions options_;
  std::shared_ptr<dom::MutationObserver> observer_;
  std::vector<dom::WeakElementPtr> pending_;
  runtime::TimerId scheduled_ = 0;
  State state_ = State::Idle;
  std::size_t dropped_batches_ = 0;
  PassResult last_pass_;
};

} // namespace domshield::shield
