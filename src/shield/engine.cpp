#include "domshield/shield/engine.hpp"

#include "domshield/observability/global.hpp"

namespace domshield::shield {

namespace {

RemovalQueueOptions removal_options(const config::EngineConfig &config) {
  RemovalQueueOptions options;
  options.batch_size = static_cast<std::size_t>(config.removal_batch_size);
  options.idle_timeout_ms = static_cast<runtime::Millis>(config.removal_idle_timeout_ms);
  options.fallback_delay_ms = static_cast<runtime::Millis>(config.removal_fallback_ms);
  options.cooldown_ms = static_cast<runtime::Millis>(config.removal_cooldown_ms);
  return options;
}

ClassifierOptions classifier_options(const config::EngineConfig &config) {
  ClassifierOptions options;
  options.budget_ms = static_cast<runtime::Millis>(config.budget_ms);
  options.quiet_threshold_ms = static_cast<runtime::Millis>(config.quiet_threshold_ms);
  return options;
}

WatcherOptions watcher_options(const config::EngineConfig &config) {
  WatcherOptions options;
  options.idle_timeout_ms = static_cast<runtime::Millis>(config.watcher_idle_timeout_ms);
  options.fallback_delay_ms = static_cast<runtime::Millis>(config.watcher_fallback_ms);
  options.merge_pending_batches = config.merge_pending_batches;
  return options;
}

} // namespace

const char *start_outcome_name(const StartOutcome outcome) {
  switch (outcome) {
  case StartOutcome::Started:
    return "started";
  case StartOutcome::AlreadyStarted:
    return "already-started";
  case StartOutcome::SkippedRelaxed:
    return "skipped-relaxed";
  case StartOutcome::SkippedLite:
    return "skipped-lite";
  case StartOutcome::SkippedCosmeticsOff:
    return "skipped-cosmetics-off";
  }
  return "unknown";
}

ShieldEngine::ShieldEngine(runtime::Page &page, config::EngineConfig config)
    : page_(page), config_(config),
      removal_queue_(page.loop(), page.idle(), removal_options(config_), &processed_),
      suppressor_(processed_, removal_queue_, counters_),
      classifier_(page.document(), page.clock(), suppressor_, classifier_options(config_)),
      style_(page.document()) {}

ShieldEngine::~ShieldEngine() { stop(); }

common::Result<StartOutcome> ShieldEngine::start(const settings::SettingsSnapshot &snapshot,
                                                 const std::int64_t now_epoch_ms) {
  auto site = settings::resolve_site(snapshot, page_.url(), now_epoch_ms);
  if (!site.ok()) {
    return common::Result<StartOutcome>::failure(site.error());
  }
  return common::Result<StartOutcome>::success(start(site.value()));
}

StartOutcome ShieldEngine::start(const settings::ResolvedSite &site) {
  if (started_) {
    return StartOutcome::AlreadyStarted;
  }
  if (site.relaxed) {
    return StartOutcome::SkippedRelaxed;
  }
  if (site.mode == settings::FilteringMode::Lite) {
    return StartOutcome::SkippedLite;
  }
  if (site.site.cosmetics_off) {
    return StartOutcome::SkippedCosmeticsOff;
  }
  started_ = true;

  rules_ = std::make_shared<const RuleConfig>(build_rule_config(site.domain, site.mode));
  classifier_.set_rules(rules_);
  (void)style_.apply(*rules_);
  const std::size_t initial = run_fast_cleanup();

  watcher_ = std::make_unique<MutationWatcher>(page_, classifier_, counters_,
                                               watcher_options(config_));
  watcher_->start();
  heal_timer_ = page_.loop().set_interval([this]() { heal_style(); },
                                          static_cast<runtime::Millis>(config_.heal_interval_ms));
  removal_queue_.start();

  if (site.mode == settings::FilteringMode::Advanced && !site.site.site_fixes_off) {
    media_guard_ = std::make_unique<MediaGuard>(page_, suppressor_,
                                                [this]() { (void)run_fast_cleanup(); });
    media_guard_->start();
    click_interceptor_ = std::make_unique<ClickInterceptor>(page_.document(), suppressor_);
    click_interceptor_->start();
  }

  observability::record_event("engine", "started on " + site.domain + " in " +
                                            std::string(settings::mode_name(site.mode)) +
                                            " mode, " + std::to_string(initial) +
                                            " elements hidden at startup");
  return StartOutcome::Started;
}

void ShieldEngine::stop() {
  click_interceptor_.reset();
  media_guard_.reset();
  watcher_.reset();
  if (heal_timer_ != 0) {
    page_.loop().clear_timer(heal_timer_);
    heal_timer_ = 0;
  }
  removal_queue_.stop();
  started_ = false;
}

std::size_t ShieldEngine::run_fast_cleanup() {
  if (!rules_) {
    return 0;
  }
  return shield::run_fast_cleanup(page_.document(), *rules_, [this](const dom::ElementPtr &element) {
    return suppressor_.hide(element);
  });
}

void ShieldEngine::heal_style() {
  if (!rules_ || style_.intact()) {
    return;
  }
  rules_ = std::make_shared<const RuleConfig>(build_rule_config(rules_->domain, rules_->mode));
  classifier_.set_rules(rules_);
  (void)style_.heal(*rules_);
}

} // namespace domshield::shield
