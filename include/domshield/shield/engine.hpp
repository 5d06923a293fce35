#pragma once

#include "domshield/common/result.hpp"
#include "domshield/config/config.hpp"
#include "domshield/runtime/page.hpp"
#include "domshield/settings/site_settings.hpp"
#include "domshield/shield/classifier.hpp"
#include "domshield/shield/click_interceptor.hpp"
#include "domshield/shield/media_guard.hpp"
#include "domshield/shield/processed_set.hpp"
#include "domshield/shield/removal_queue.hpp"
#include "domshield/shield/rule_config.hpp"
#include "domshield/shield/suppression_style.hpp"
#include "domshield/shield/suppressor.hpp"
#include "domshield/shield/watcher.hpp"

#include <cstdint>
#include <memory>

namespace domshield::shield {

enum class StartOutcome {
  Started,
  AlreadyStarted,
  SkippedRelaxed,
  SkippedLite,
  SkippedCosmeticsOff,
};

[[nodiscard]] const char *start_outcome_name(StartOutcome outcome);

/// Content defense for one page: suppression style, fast cleanup, mutation watcher, removal
/// loop and, in advanced mode, the media guard and click interceptor.
class ShieldEngine {
public:
  explicit ShieldEngine(runtime::Page &page, config::EngineConfig config = {});
  ~ShieldEngine();

  ShieldEngine(const ShieldEngine &) = delete;
  ShieldEngine &operator=(const ShieldEngine &) = delete;

  /// Resolves the page's site from `snapshot` and starts. Fails on an invalid page host.
  common::Result<StartOutcome> start(const settings::SettingsSnapshot &snapshot,
                                     std::int64_t now_epoch_ms);
  StartOutcome start(const settings::ResolvedSite &site);
  void stop();

  /// Hides every element matching the fast rules. Returns the number hidden.
  std::size_t run_fast_cleanup();
  bool hide(const dom::ElementPtr &element) { return suppressor_.hide(element); }

  [[nodiscard]] const Counters &stats() const { return counters_; }
  [[nodiscard]] bool started() const { return started_; }
  [[nodiscard]] const std::shared_ptr<const RuleConfig> &rules() const { return rules_; }

  [[nodiscard]] BudgetedClassifier &classifier() { return classifier_; }
  [[nodiscard]] SuppressionStyle &style() { return style_; }
  [[nodiscard]] RemovalQueue &removal_queue() { return removal_queue_; }
  [[nodiscard]] const ProcessedSet &processed() const { return processed_; }
  [[nodiscard]] MutationWatcher *watcher() { return watcher_.get(); }
  [[nodiscard]] MediaGuard *media_guard() { return media_guard_.get(); }
  [[nodiscard]] ClickInterceptor *click_interceptor() { return click_interceptor_.get(); }

private:
  void heal_style();

  runtime::Page &page_;
  config::EngineConfig config_;
  Counters counters_;
  ProcessedSet processed_;
  RemovalQueue removal_queue_;
  Suppressor suppressor_;
  BudgetedClassifier classifier_;
  SuppressionStyle style_;
  std::shared_ptr<const RuleConfig> rules_;
  runtime::TimerId heal_timer_ = 0;
  bool started_ = false;
  std::unique_ptr<MutationWatcher> watcher_;
  std::unique_ptr<MediaGuard> media_guard_;
  std::unique_ptr<ClickInterceptor> click_interceptor_;
};

} // namespace domshield::shield
