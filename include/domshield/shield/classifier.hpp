#pragma once

#include "domshield/dom/document.hpp"
#include "domshield/dom/selector.hpp"
#include "domshield/runtime/clock.hpp"
#include "domshield/settings/site_settings.hpp"
#include "domshield/shield/rule_config.hpp"
#include "domshield/shield/suppressor.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace domshield::shield {

struct ClassifierOptions {
  runtime::Millis budget_ms = 8;
  runtime::Millis quiet_threshold_ms = 10'000;
  std::size_t max_depth = 32;
  /// Children are examined only when a node has fewer than this many.
  std::size_t max_children = 30;
  /// Ancestors examined when escalating a marked element to its container.
  std::size_t escalation_depth = 10;
};

struct QuietState {
  bool active = false;
  runtime::Millis last_hide = 0;
};

struct PassResult {
  std::size_t candidates_examined = 0;
  std::size_t nodes_examined = 0;
  std::size_t hides = 0;
  bool budget_exhausted = false;
};

/// Classifies candidate elements under a per-pass deadline and hides the ones that match.
/// Quiet mode switches the advanced heuristics off after a stretch without hides.
class BudgetedClassifier {
public:
  BudgetedClassifier(dom::Document &document, const runtime::Clock &clock, Suppressor &suppressor,
                     ClassifierOptions options = {});

  void set_rules(std::shared_ptr<const RuleConfig> rules) { rules_ = std::move(rules); }
  [[nodiscard]] const std::shared_ptr<const RuleConfig> &rules() const { return rules_; }

  /// Candidates are visited in order until the deadline passes; the rest are dropped.
  PassResult run_pass(const std::vector<dom::WeakElementPtr> &candidates);

  /// Hides the highest positioned or stacked ancestor of `element` (at most
  /// `escalation_depth` levels, never past body), or `element` itself.
  bool escalate_and_hide(const dom::ElementPtr &element);

  [[nodiscard]] const QuietState &quiet() const { return quiet_; }
  /// Starts the quiet-mode clock, as if a hide happened at `now`.
  void reset_quiet(runtime::Millis now);

private:
  struct Work {
    dom::ElementPtr element;
    std::size_t depth = 0;
  };

  bool classify(const dom::ElementPtr &element);
  bool apply_heuristics(const dom::ElementPtr &element);
  bool is_obfuscated_cluster(const dom::Element &element) const;
  bool is_full_bleed_overlay(const dom::Element &element) const;
  dom::ElementPtr icon_fingerprint_container(const dom::ElementPtr &element) const;
  bool record_hide(const dom::ElementPtr &element);
  bool record_heuristic_hide(const dom::ElementPtr &element);
  [[nodiscard]] bool advanced_enabled() const;

  dom::Document &document_;
  const runtime::Clock &clock_;
  Suppressor &suppressor_;
  ClassifierOptions options_;
  std::shared_ptr<const RuleConfig> rules_;
  QuietState quiet_;
  dom::SelectorList svg_selector_;
  dom::SelectorList fixed_container_selector_;
  std::size_t pass_hides_ = 0;
};

} // namespace domshield::shield
