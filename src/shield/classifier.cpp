#include "domshield/shield/classifier.hpp"

#include "domshield/common/string_util.hpp"
#include "domshield/dom/errors.hpp"
#include "domshield/shield/markers.hpp"
#include "domshield/shield/processed_set.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace domshield::shield {

namespace {

constexpr std::size_t OBFUSCATED_MIN_TOKENS = 3;
constexpr std::size_t OBFUSCATED_MIN_LENGTH = 16;
constexpr int OVERLAY_MIN_Z_INDEX = 101;
constexpr double OVERLAY_VIEWPORT_FRACTION = 0.7;

constexpr std::array<std::string_view, 3> ICON_VIEW_BOXES = {"0 0 8 8", "0 0 87 16",
                                                             "0 0 85 16"};

bool looks_generated(const std::string &token) {
  if (token.size() < OBFUSCATED_MIN_LENGTH) {
    return false;
  }
  const bool has_upper = std::any_of(token.begin(), token.end(), [](unsigned char ch) {
    return std::isupper(ch) != 0;
  });
  const bool has_digit = std::any_of(token.begin(), token.end(), [](unsigned char ch) {
    return std::isdigit(ch) != 0 || ch == '_';
  });
  return has_upper && has_digit;
}

} // namespace

BudgetedClassifier::BudgetedClassifier(dom::Document &document, const runtime::Clock &clock,
                                       Suppressor &suppressor, ClassifierOptions options)
    : document_(document), clock_(clock), suppressor_(suppressor), options_(options),
      svg_selector_(builtin_selector("svg")),
      fixed_container_selector_(builtin_selector("div[style*=\"fixed\"]")) {}

void BudgetedClassifier::reset_quiet(const runtime::Millis now) {
  quiet_.active = false;
  quiet_.last_hide = now;
}

bool BudgetedClassifier::advanced_enabled() const {
  return rules_ && rules_->mode == settings::FilteringMode::Advanced && !quiet_.active;
}

// ---------------------------------------------------------------------------
// Pass
// ---------------------------------------------------------------------------

PassResult BudgetedClassifier::run_pass(const std::vector<dom::WeakElementPtr> &candidates) {
  PassResult result;
  pass_hides_ = 0;
  const runtime::Millis deadline = clock_.now_ms() + options_.budget_ms;
  const auto &processed = suppressor_.processed();

  for (const auto &weak : candidates) {
    if (clock_.now_ms() > deadline) {
      result.budget_exhausted = true;
      break;
    }
    const auto candidate = weak.lock();
    if (!candidate || !candidate->is_connected() || processed.contains(*candidate)) {
      continue;
    }
    ++result.candidates_examined;

    std::vector<Work> worklist{{candidate, 0}};
    while (!worklist.empty()) {
      Work work = std::move(worklist.back());
      worklist.pop_back();
      if (work.depth > 0) {
        if (clock_.now_ms() > deadline) {
          result.budget_exhausted = true;
          break;
        }
        if (processed.contains(*work.element)) {
          continue;
        }
      }
      ++result.nodes_examined;
      if (classify(work.element)) {
        continue;
      }

      const auto &children = work.element->children();
      if (children.empty() || children.size() >= options_.max_children ||
          work.depth + 1 > options_.max_depth) {
        continue;
      }
      for (auto it = children.rbegin(); it != children.rend(); ++it) {
        worklist.push_back({*it, work.depth + 1});
      }
    }
    if (result.budget_exhausted) {
      break;
    }
  }

  result.hides = pass_hides_;
  const runtime::Millis now = clock_.now_ms();
  if (pass_hides_ == 0) {
    if (!quiet_.active && now - quiet_.last_hide > options_.quiet_threshold_ms) {
      quiet_.active = true;
    }
  } else {
    quiet_.active = false;
    quiet_.last_hide = now;
  }
  return result;
}

bool BudgetedClassifier::classify(const dom::ElementPtr &element) {
  if (rules_ && element->matches(rules_->fast_selector)) {
    (void)record_hide(element);
    return true;
  }
  if (has_marker_attribute(*element) || has_slot_class(*element)) {
    (void)escalate_and_hide(element);
    return true;
  }
  if (element->tag_name() == "iframe" &&
      matches_network(element->get_attribute("src").value_or(""), frame_networks())) {
    (void)record_hide(element);
    return true;
  }
  if (advanced_enabled()) {
    return apply_heuristics(element);
  }
  return false;
}

bool BudgetedClassifier::escalate_and_hide(const dom::ElementPtr &element) {
  if (!element) {
    return false;
  }
  dom::ElementPtr root = element;
  const auto body = document_.body();
  auto current = element->parent();
  for (std::size_t depth = 0; current && current != body && depth < options_.escalation_depth;
       ++depth) {
    try {
      const auto style = current->computed_style();
      if (style.is_out_of_flow() || style.z_index != "auto") {
        root = current;
      }
    } catch (const dom::DetachedNodeError &) {
      break;
    }
    current = current->parent();
  }
  return record_hide(root);
}

bool BudgetedClassifier::record_hide(const dom::ElementPtr &element) {
  if (!suppressor_.hide(element)) {
    return false;
  }
  ++pass_hides_;
  quiet_.active = false;
  quiet_.last_hide = clock_.now_ms();
  return true;
}

bool BudgetedClassifier::record_heuristic_hide(const dom::ElementPtr &element) {
  if (!record_hide(element)) {
    return false;
  }
  ++suppressor_.counters().heuristic_removals;
  return true;
}

// ---------------------------------------------------------------------------
// Advanced heuristics
// ---------------------------------------------------------------------------

bool BudgetedClassifier::apply_heuristics(const dom::ElementPtr &element) {
  if (is_obfuscated_cluster(*element)) {
    return record_heuristic_hide(element);
  }
  if (is_full_bleed_overlay(*element)) {
    return record_heuristic_hide(element);
  }
  if (auto container = icon_fingerprint_container(element)) {
    return record_heuristic_hide(container);
  }
  return false;
}

bool BudgetedClassifier::is_obfuscated_cluster(const dom::Element &element) const {
  const auto tokens = element.class_list();
  if (tokens.size() < OBFUSCATED_MIN_TOKENS) {
    return false;
  }
  const auto generated = std::count_if(tokens.begin(), tokens.end(), looks_generated);
  if (generated < static_cast<std::ptrdiff_t>(OBFUSCATED_MIN_TOKENS)) {
    return false;
  }
  try {
    return element.computed_style().is_out_of_flow();
  } catch (const dom::DetachedNodeError &) {
    return false;
  }
}

bool BudgetedClassifier::is_full_bleed_overlay(const dom::Element &element) const {
  try {
    const auto style = element.computed_style();
    if (!style.is_out_of_flow()) {
      return false;
    }
    const auto z_index = style.z_index_value();
    if (!z_index.has_value() || *z_index < OVERLAY_MIN_Z_INDEX) {
      return false;
    }
  } catch (const dom::DetachedNodeError &) {
    return false;
  }

  const auto rect = element.bounding_client_rect();
  const auto &viewport = document_.viewport();
  if (rect.width < viewport.width * OVERLAY_VIEWPORT_FRACTION ||
      rect.height < viewport.height * OVERLAY_VIEWPORT_FRACTION) {
    return false;
  }
  return common::trim(element.text_content()).empty() || has_marker_attribute(element);
}

dom::ElementPtr
BudgetedClassifier::icon_fingerprint_container(const dom::ElementPtr &element) const {
  const auto svg =
      element->tag_name() == "svg" ? element : element->query_selector(svg_selector_);
  if (!svg) {
    return nullptr;
  }
  const std::string view_box = svg->get_attribute("viewBox").value_or("");
  if (std::find(ICON_VIEW_BOXES.begin(), ICON_VIEW_BOXES.end(), view_box) ==
      ICON_VIEW_BOXES.end()) {
    return nullptr;
  }
  auto container = element->closest(fixed_container_selector_);
  if (container && suppressor_.processed().contains(*container)) {
    return nullptr;
  }
  return container;
}

} // namespace domshield::shield
