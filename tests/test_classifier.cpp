#include "test_framework.hpp"

#include "domshield/dom/document.hpp"
#include "domshield/runtime/clock.hpp"
#include "domshield/runtime/event_loop.hpp"
#include "domshield/runtime/idle_scheduler.hpp"
#include "domshield/shield/classifier.hpp"
#include "domshield/shield/processed_set.hpp"
#include "domshield/shield/removal_queue.hpp"
#include "domshield/shield/rule_config.hpp"
#include "domshield/shield/suppressor.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace dom = domshield::dom;
namespace runtime = domshield::runtime;
namespace shield = domshield::shield;
using domshield::settings::FilteringMode;

struct ClassifierHarness {
  runtime::ManualClock clock;
  std::shared_ptr<dom::Document> document = dom::Document::create();
  runtime::EventLoop loop{clock};
  runtime::IdleScheduler idle{loop, true};
  shield::ProcessedSet processed;
  shield::RemovalQueue queue{loop, idle, {}, &processed};
  shield::Counters counters;
  shield::Suppressor suppressor{processed, queue, counters};
  shield::BudgetedClassifier classifier;

  explicit ClassifierHarness(FilteringMode mode)
      : classifier(*document, clock, suppressor) {
    classifier.set_rules(
        std::make_shared<const shield::RuleConfig>(shield::build_rule_config("a.test", mode)));
    classifier.reset_quiet(clock.now_ms());
  }

  dom::ElementPtr add(const std::string &tag, const dom::ElementPtr &parent = nullptr) {
    auto element = document->create_element(tag);
    (parent ? parent : document->body())->append_child(element);
    return element;
  }

  dom::ElementPtr add_overlay() {
    auto overlay = add("div");
    overlay->set_attribute("style", "position: fixed; z-index: 9999");
    dom::LayoutBox box;
    box.position = dom::Position::Fixed;
    box.rect = {0.0, 0.0, 1280.0, 720.0};
    overlay->set_layout(box);
    return overlay;
  }
};

std::vector<dom::WeakElementPtr> weak_list(const std::vector<dom::ElementPtr> &elements) {
  return {elements.begin(), elements.end()};
}

bool is_suppressed(const dom::ElementPtr &element) {
  return element->style_property("display") == std::string("none");
}

} // namespace

void register_classifier_tests(std::vector<domshield::tests::TestCase> &tests) {
  using domshield::tests::require;

  tests.push_back({"classifier_stops_at_budget_deadline", [] {
                     ClassifierHarness h(FilteringMode::Standard);
                     std::vector<dom::ElementPtr> candidates;
                     candidates.reserve(10'000);
                     for (int i = 0; i < 10'000; ++i) {
                       candidates.push_back(h.add("div"));
                     }
                     // Every clock read costs a millisecond.
                     h.clock.set_tick_per_read(1);
                     const auto result = h.classifier.run_pass(weak_list(candidates));
                     require(result.budget_exhausted, "pass should run out of budget");
                     require(result.candidates_examined > 0, "some candidates examined");
                     require(result.candidates_examined < 50,
                             "examined " + std::to_string(result.candidates_examined));
                   }});

  tests.push_back({"classifier_hides_rule_network_and_marker_matches", [] {
                     ClassifierHarness h(FilteringMode::Standard);
                     auto zone = h.add("div");
                     zone->set_attribute("data-izone", "7");
                     auto frame = h.add("iframe");
                     frame->set_attribute("src", "https://cdn.Taboola.com/widget");
                     auto clean = h.add("p");
                     clean->set_text("article");

                     const auto result = h.classifier.run_pass(weak_list({zone, frame, clean}));
                     require(result.hides == 2, "zone and frame hidden");
                     require(is_suppressed(zone) && is_suppressed(frame), "styles forced");
                     require(!is_suppressed(clean), "content untouched");
                     require(h.counters.hides == 2, "hide counter");
                     require(h.queue.size() == 2, "hidden elements queued for removal");

                     const auto again = h.classifier.run_pass(weak_list({zone, frame}));
                     require(again.candidates_examined == 0, "processed elements skipped");
                     require(h.counters.hides == 2, "no double counting");
                   }});

  tests.push_back({"classifier_escalates_to_positioned_container", [] {
                     ClassifierHarness h(FilteringMode::Standard);
                     auto wrapper = h.add("div");
                     wrapper->set_attribute("style", "position: fixed; bottom: 0");
                     auto inner = h.add("div", wrapper);
                     auto slot = h.add("section", inner);
                     slot->set_attribute("class", "topAdSlot");

                     const auto result = h.classifier.run_pass(weak_list({slot}));
                     require(result.hides == 1, "one hide");
                     require(is_suppressed(wrapper), "fixed wrapper hidden");
                     require(!is_suppressed(slot), "slot itself left alone");

                     auto direct = h.add("span");
                     require(h.classifier.escalate_and_hide(direct), "hide without ancestor");
                     require(is_suppressed(direct), "escalation stops at body");
                   }});

  tests.push_back({"classifier_escalation_looks_ten_ancestors_up", [] {
                     ClassifierHarness h(FilteringMode::Standard);
                     // Positioned container `levels` ancestors above the returned marker.
                     const auto nest = [&h](int levels) {
                       auto container = h.add("div");
                       container->set_attribute("style", "position: absolute");
                       auto parent = container;
                       for (int i = 1; i < levels; ++i) {
                         parent = h.add("div", parent);
                       }
                       auto marked = h.add("span", parent);
                       marked->set_attribute("data-element", "x");
                       return std::make_pair(container, marked);
                     };

                     const auto [near_container, near_marked] = nest(10);
                     require(h.classifier.escalate_and_hide(near_marked), "tenth level hide");
                     require(is_suppressed(near_container), "container at level ten chosen");
                     require(!is_suppressed(near_marked), "marker left to its container");

                     const auto [far_container, far_marked] = nest(11);
                     require(h.classifier.escalate_and_hide(far_marked), "eleventh level hide");
                     require(!is_suppressed(far_container), "container past the bound kept");
                     require(is_suppressed(far_marked), "marker hidden itself");
                   }});

  tests.push_back({"classifier_descends_small_subtrees_only", [] {
                     ClassifierHarness h(FilteringMode::Standard);
                     auto small = h.add("div");
                     for (int i = 0; i < 29; ++i) {
                       h.add("span", small)->set_attribute("data-element", "x");
                     }
                     auto wide = h.add("div");
                     for (int i = 0; i < 30; ++i) {
                       h.add("span", wide)->set_attribute("data-element", "x");
                     }

                     auto result = h.classifier.run_pass(weak_list({small}));
                     require(result.hides == 29, "children of a 29-child node examined");
                     result = h.classifier.run_pass(weak_list({wide}));
                     require(result.hides == 0, "30 children are not descended");
                   }});

  tests.push_back({"classifier_heuristics_run_in_advanced_mode_only", [] {
                     ClassifierHarness standard(FilteringMode::Standard);
                     auto overlay = standard.add_overlay();
                     auto result = standard.classifier.run_pass(weak_list({overlay}));
                     require(result.hides == 0, "no heuristics in standard mode");

                     ClassifierHarness advanced(FilteringMode::Advanced);
                     auto full = advanced.add_overlay();
                     auto cluster = advanced.add("div");
                     cluster->set_attribute("class",
                                            "Xk29dLq81mZpQ7rT Ab12cd34Ef56gh78 Zz9_yy8xXw7vV6uU");
                     cluster->set_attribute("style", "position: absolute");
                     cluster->set_text("buy now");
                     auto icon_box = advanced.add("div");
                     icon_box->set_attribute("style", "position: fixed; right: 0");
                     auto link = advanced.add("a", icon_box);
                     advanced.add("svg", link)->set_attribute("viewBox", "0 0 87 16");

                     result = advanced.classifier.run_pass(weak_list({full, cluster, link}));
                     require(result.hides == 3, "overlay, cluster and icon container");
                     require(is_suppressed(icon_box), "fixed container of the icon hidden");
                     require(advanced.counters.heuristic_removals == 3, "heuristic counter");
                   }});

  tests.push_back({"classifier_overlay_with_text_is_kept", [] {
                     ClassifierHarness h(FilteringMode::Advanced);
                     auto dialog = h.add_overlay();
                     dialog->set_text("Accept cookies?");
                     auto small = h.add_overlay();
                     dom::LayoutBox box = small->layout();
                     box.rect = {0.0, 0.0, 1280.0, 300.0};
                     small->set_layout(box);

                     const auto result = h.classifier.run_pass(weak_list({dialog, small}));
                     require(result.hides == 0, "text overlay and short overlay survive");
                   }});

  tests.push_back({"classifier_quiet_mode_has_hysteresis", [] {
                     ClassifierHarness h(FilteringMode::Advanced);
                     h.clock.set(10'000);
                     (void)h.classifier.run_pass({});
                     require(!h.classifier.quiet().active, "threshold not yet exceeded");

                     h.clock.set(10'001);
                     (void)h.classifier.run_pass({});
                     require(h.classifier.quiet().active, "quiet after 10s without hides");

                     auto overlay = h.add_overlay();
                     auto result = h.classifier.run_pass(weak_list({overlay}));
                     require(result.hides == 0, "heuristics off while quiet");

                     auto marked = h.add("div");
                     marked->set_attribute("data-element", "late");
                     result = h.classifier.run_pass(weak_list({marked}));
                     require(result.hides == 1, "rules still run while quiet");
                     require(!h.classifier.quiet().active, "a hide leaves quiet mode");

                     result = h.classifier.run_pass(weak_list({overlay}));
                     require(result.hides == 1, "heuristics back on");
                   }});

  tests.push_back({"classifier_skips_detached_candidates", [] {
                     ClassifierHarness h(FilteringMode::Standard);
                     auto orphan = h.document->create_element("div");
                     orphan->set_attribute("data-izone", "1");
                     const auto result = h.classifier.run_pass(weak_list({orphan}));
                     require(result.candidates_examined == 0 && result.hides == 0,
                             "detached candidate ignored");
                   }});
}
