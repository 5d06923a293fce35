#include "domshield/shield/watcher.hpp"

#include "domshield/observability/global.hpp"
#include "domshield/shield/markers.hpp"

namespace domshield::shield {

MutationWatcher::MutationWatcher(runtime::Page &page, BudgetedClassifier &classifier,
                                 Counters &counters, WatcherOptions options)
    : page_(page), classifier_(classifier), counters_(counters), options_(options) {}

MutationWatcher::~MutationWatcher() { stop(); }

void MutationWatcher::start() {
  if (observer_) {
    return;
  }
  observer_ = std::make_shared<dom::MutationObserver>(
      [this](const std::vector<dom::MutationRecord> &records) { handle_mutations(records); });

  dom::MutationObserverInit init;
  init.child_list = true;
  init.subtree = true;
  init.attributes = true;
  init.attribute_filter = {std::string(MARKER_ELEMENT_ATTR), std::string(MARKER_ZONE_ATTR)};
  observer_->observe(page_.document().document_element(), std::move(init));

  classifier_.reset_quiet(page_.clock().now_ms());
  state_ = State::Idle;
}

void MutationWatcher::stop() {
  if (observer_) {
    observer_->disconnect();
    observer_.reset();
  }
  if (scheduled_ != 0) {
    page_.idle().cancel(scheduled_);
    scheduled_ = 0;
  }
  pending_.clear();
  state_ = State::Idle;
}

void MutationWatcher::handle_mutations(const std::vector<dom::MutationRecord> &records) {
  std::vector<dom::ElementPtr> targets;
  for (const auto &record : records) {
    if (record.type == dom::MutationRecord::Type::ChildList) {
      targets.insert(targets.end(), record.added.begin(), record.added.end());
    } else if (record.target) {
      targets.push_back(record.target);
    }
  }
  if (targets.empty()) {
    return;
  }

  const State previous = state_;
  state_ = State::Collecting;
  for (const auto &target : targets) {
    if (target && target->is_connected() && has_marker_attribute(*target)) {
      (void)classifier_.escalate_and_hide(target);
    }
  }

  if (previous == State::Deferred) {
    state_ = State::Deferred;
    if (!options_.merge_pending_batches) {
      ++dropped_batches_;
      observability::record_debug("watcher", "pass pending, dropped " +
                                                 std::to_string(targets.size()) + " candidates");
      return;
    }
    pending_.insert(pending_.end(), targets.begin(), targets.end());
    return;
  }

  pending_.assign(targets.begin(), targets.end());
  state_ = State::Deferred;
  scheduled_ = page_.idle().schedule([this]() { run_deferred_pass(); }, options_.idle_timeout_ms,
                                     options_.fallback_delay_ms);
}

void MutationWatcher::run_deferred_pass() {
  scheduled_ = 0;
  std::vector<dom::WeakElementPtr> candidates;
  candidates.swap(pending_);
  last_pass_ = classifier_.run_pass(candidates);
  ++counters_.batches;
  state_ = State::Idle;
  if (last_pass_.budget_exhausted) {
    observability::record_debug("watcher", "budget exhausted after " +
                                               std::to_string(last_pass_.candidates_examined) +
                                               " of " + std::to_string(candidates.size()) +
                                               " candidates");
  }
}

} // namespace domshield::shield
