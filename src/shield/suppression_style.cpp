#include "domshield/shield/suppression_style.hpp"

#include "domshield/common/hash.hpp"
#include "domshield/common/string_util.hpp"
#include "domshield/observability/global.hpp"
#include "domshield/shield/markers.hpp"

namespace domshield::shield {

SuppressionStyle::SuppressionStyle(dom::Document &document) : document_(document) {}

std::string SuppressionStyle::render(const std::vector<std::string> &rules) {
  return common::join(rules, ",\n") +
         " {\n"
         "  display: none !important;\n"
         "  visibility: hidden !important;\n"
         "  pointer-events: none !important;\n"
         "}";
}

std::string SuppressionStyle::fingerprint_of(const std::vector<std::string> &rules) {
  return common::sha256_hex(common::join(rules, ","));
}

dom::ElementPtr SuppressionStyle::element() const {
  auto found = document_.get_element_by_id(SUPPRESSION_STYLE_ID);
  return found && found->is_connected() ? found : nullptr;
}

bool SuppressionStyle::installed() const { return element() != nullptr; }

bool SuppressionStyle::intact() const {
  const auto style = element();
  if (!style) {
    return false;
  }
  if (text_fingerprint_.empty()) {
    return true;
  }
  return common::sha256_hex(style->own_text()) == text_fingerprint_;
}

bool SuppressionStyle::apply(const RuleConfig &rules) {
  const auto all_rules = rules.all_rules();
  if (all_rules.empty()) {
    return false;
  }

  const std::string fingerprint = fingerprint_of(all_rules);
  auto style = element();
  if (style && !fingerprint.empty() && fingerprint == fingerprint_) {
    return false;
  }
  fingerprint_ = fingerprint;

  if (!style) {
    style = document_.create_element("style");
    style->set_attribute("id", std::string(SUPPRESSION_STYLE_ID));
    auto head = document_.head();
    if (head && head->is_connected()) {
      head->append_child(style);
    } else {
      document_.document_element()->append_child(style);
    }
  }
  const std::string text = render(all_rules);
  style->set_text(text);
  text_fingerprint_ = common::sha256_hex(text);
  observability::record_debug("style", "suppression style written with " +
                                           std::to_string(all_rules.size()) + " rules");
  return true;
}

bool SuppressionStyle::heal(const RuleConfig &rules) {
  if (intact()) {
    return false;
  }
  observability::record_event("style", installed()
                                           ? "suppression style rewritten by the page, restoring"
                                           : "suppression style missing, re-installing");
  fingerprint_.clear();
  return apply(rules);
}

} // namespace domshield::shield
