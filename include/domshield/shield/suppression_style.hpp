#pragma once

#include "domshield/dom/document.hpp"
#include "domshield/shield/rule_config.hpp"

#include <string>
#include <vector>

namespace domshield::shield {

/// The single `<style id="domshield-suppression">` element carrying every rule.
class SuppressionStyle {
public:
  explicit SuppressionStyle(dom::Document &document);

  /// Writes the element when the rule fingerprint changed or the element is missing.
  /// Returns true when the element was written.
  bool apply(const RuleConfig &rules);
  /// Re-installs the element if a page script removed it or rewrote its text.
  bool heal(const RuleConfig &rules);

  [[nodiscard]] bool installed() const;
  /// Installed and still carrying the text last written.
  [[nodiscard]] bool intact() const;
  [[nodiscard]] dom::ElementPtr element() const;
  [[nodiscard]] const std::string &fingerprint() const { return fingerprint_; }

  [[nodiscard]] static std::string render(const std::vector<std::string> &rules);
  /// SHA-256 of the rules joined by ",". Empty when hashing is unavailable.
  [[nodiscard]] static std::string fingerprint_of(const std::vector<std::string> &rules);

private:
  dom::Document &document_;
  std::string fingerprint_;
  std::string text_fingerprint_;
};

} // namespace domshield::shield
