#pragma once

#include "domshield/dom/document.hpp"
#include "domshield/dom/selector.hpp"
#include "domshield/settings/site_settings.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace domshield::shield {

struct RuleConfig {
  std::string domain;
  settings::FilteringMode mode = settings::FilteringMode::Lite;
  std::vector<std::string> fast_rules;
  std::vector<std::string> slow_rules;
  /// Union of the fast rules that parsed.
  dom::SelectorList fast_selector;

  [[nodiscard]] std::vector<std::string> all_rules() const;
};

/// Domains whose own markup trips the generic `ad-` rules.
[[nodiscard]] bool is_generic_rule_exempt(std::string_view domain);

/// Rules for one page load. Rules that fail to parse are dropped and logged.
[[nodiscard]] RuleConfig build_rule_config(std::string_view domain, settings::FilteringMode mode);

/// Parses a selector that ships with the engine. Throws std::invalid_argument on failure.
[[nodiscard]] dom::SelectorList builtin_selector(std::string_view text);

/// Hides every element matching the fast rules through `hide`. Returns the number hidden.
template <typename HideFn>
std::size_t run_fast_cleanup(const dom::Document &document, const RuleConfig &rules,
                             HideFn &&hide) {
  if (rules.fast_selector.empty()) {
    return 0;
  }
  std::size_t hidden = 0;
  for (const auto &element : document.query_selector_all(rules.fast_selector)) {
    if (hide(element)) {
      ++hidden;
    }
  }
  return hidden;
}

} // namespace domshield::shield
