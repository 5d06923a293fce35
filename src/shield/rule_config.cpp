#include "domshield/shield/rule_config.hpp"

#include "domshield/common/string_util.hpp"
#include "domshield/observability/global.hpp"

#include <stdexcept>

namespace domshield::shield {

namespace {

const std::vector<std::string> &base_fast_rules() {
  static const std::vector<std::string> rules = {
      ".ad-container",
      "#sidebar-ads",
      ".sponsored-post",
      ".ads-block",
      ".ad-box",
      ".ad-wrapper",
      ".ads-label",
      "[data-element]",
      "[data-izone]",
      "iframe[src*=\"exoclick\"]",
      "iframe[src*=\"adsterra\"]",
      "iframe[src*=\"juicyads\"]",
      "iframe[src*=\"trafficjunky\"]",
      "iframe[title=\"offer\"]",
      "iframe[title=\"Advertisement\"]",
      "div[id^=\"__clb-spot_\"]",
      "iframe[id^=\"__clb-spot_\"]",
      "div[class*=\"AdSlot\"]",
      "div[class*=\"AdsContainer\"]",
      ".modal-backdrop",
  };
  return rules;
}

const std::vector<std::string> &generic_fast_rules() {
  static const std::vector<std::string> rules = {
      "div[class*=\"ad-\"]",
      "div[id*=\"ad-\"]",
  };
  return rules;
}

const std::vector<std::string> &advanced_slow_rules() {
  static const std::vector<std::string> rules = {
      "div[style*=\"z-index: 2147483647\"]",
      "div[style*=\"bottom: 10px\"] iframe",
      ".overlay-container",
  };
  return rules;
}

const std::vector<std::string> &generic_exempt_domains() {
  static const std::vector<std::string> domains = {"youtube.com"};
  return domains;
}

} // namespace

std::vector<std::string> RuleConfig::all_rules() const {
  std::vector<std::string> out = fast_rules;
  out.insert(out.end(), slow_rules.begin(), slow_rules.end());
  return out;
}

bool is_generic_rule_exempt(std::string_view domain) {
  const std::string lower = common::to_lower(std::string(domain));
  for (const auto &exempt : generic_exempt_domains()) {
    if (lower == exempt || common::ends_with(lower, "." + exempt)) {
      return true;
    }
  }
  return false;
}

RuleConfig build_rule_config(std::string_view domain, const settings::FilteringMode mode) {
  RuleConfig config;
  config.domain = common::to_lower(std::string(domain));
  config.mode = mode;

  std::vector<std::string> candidates = base_fast_rules();
  if (!is_generic_rule_exempt(config.domain)) {
    candidates.insert(candidates.end(), generic_fast_rules().begin(), generic_fast_rules().end());
  }
  for (auto &rule : candidates) {
    const auto parsed = dom::SelectorList::parse(rule);
    if (!parsed.ok()) {
      observability::record_error("rules", "dropping fast rule: " + parsed.error());
      continue;
    }
    config.fast_rules.push_back(std::move(rule));
  }

  if (mode == settings::FilteringMode::Advanced) {
    for (const auto &rule : advanced_slow_rules()) {
      const auto parsed = dom::SelectorList::parse(rule);
      if (!parsed.ok()) {
        observability::record_error("rules", "dropping slow rule: " + parsed.error());
        continue;
      }
      config.slow_rules.push_back(rule);
    }
  }

  if (!config.fast_rules.empty()) {
    auto combined = dom::SelectorList::parse(common::join(config.fast_rules, ", "));
    if (combined.ok()) {
      config.fast_selector = std::move(combined.value());
    } else {
      observability::record_error("rules", "combined fast selector rejected: " + combined.error());
    }
  }
  return config;
}

dom::SelectorList builtin_selector(std::string_view text) {
  auto parsed = dom::SelectorList::parse(text);
  if (!parsed.ok()) {
    throw std::invalid_argument(parsed.error());
  }
  return std::move(parsed.value());
}

} // namespace domshield::shield
