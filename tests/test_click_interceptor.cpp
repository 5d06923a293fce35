#include "test_framework.hpp"

#include "domshield/dom/document.hpp"
#include "domshield/runtime/clock.hpp"
#include "domshield/runtime/event_loop.hpp"
#include "domshield/runtime/idle_scheduler.hpp"
#include "domshield/shield/click_interceptor.hpp"
#include "domshield/shield/processed_set.hpp"
#include "domshield/shield/removal_queue.hpp"
#include "domshield/shield/suppressor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

namespace dom = domshield::dom;
namespace runtime = domshield::runtime;
namespace shield = domshield::shield;

struct ClickHarness {
  runtime::ManualClock clock;
  std::shared_ptr<dom::Document> document = dom::Document::create();
  runtime::EventLoop loop{clock};
  runtime::IdleScheduler idle{loop, true};
  shield::ProcessedSet processed;
  shield::RemovalQueue queue{loop, idle, {}, &processed};
  shield::Counters counters;
  shield::Suppressor suppressor{processed, queue, counters};
  shield::ClickInterceptor interceptor{*document, suppressor};

  // Positioned box covering `width_fraction` x `height_fraction` of the 1280x720 viewport.
  dom::ElementPtr add_box(const std::string &tag, double width_fraction, double height_fraction,
                          const std::string &style = "position: fixed; z-index: 1000") {
    auto element = document->create_element(tag);
    element->set_attribute("style", style);
    dom::LayoutBox box;
    box.rect = {0.0, 0.0, 1280.0 * width_fraction, 720.0 * height_fraction};
    element->set_layout(box);
    document->body()->append_child(element);
    return element;
  }
};

} // namespace

void register_click_interceptor_tests(std::vector<domshield::tests::TestCase> &tests) {
  using domshield::tests::require;

  tests.push_back({"click_interceptor_swallows_clicks_on_large_overlays", [] {
                     ClickHarness h;
                     h.interceptor.start();
                     auto overlay = h.add_box("div", 0.6, 0.6);
                     bool page_saw_click = false;
                     overlay->add_event_listener(
                         "click", [&page_saw_click](dom::Event &) { page_saw_click = true; });

                     dom::Event click("click");
                     require(!h.document->dispatch_event(overlay, click), "default prevented");
                     require(!page_saw_click, "page handler never ran");
                     require(h.interceptor.intercepted() == 1, "intercept counted");
                     require(overlay->style_property("display") == std::string("none"),
                             "overlay hidden");
                   }});

  tests.push_back({"click_interceptor_passes_small_or_safe_targets", [] {
                     ClickHarness h;
                     h.interceptor.start();
                     auto badge = h.add_box("div", 0.1, 0.1);
                     auto dialog = h.add_box("dialog", 0.6, 0.6);
                     auto low = h.add_box("div", 0.6, 0.6, "position: fixed; z-index: 10");
                     auto in_flow = h.add_box("div", 0.6, 0.6, "z-index: 1000");

                     for (const auto &target : {badge, dialog, low, in_flow}) {
                       dom::Event click("click");
                       require(h.document->dispatch_event(target, click),
                               "click should reach <" + target->tag_name() + ">");
                     }
                     require(h.interceptor.intercepted() == 0, "nothing intercepted");
                     require(h.counters.hides == 0, "nothing hidden");
                   }});

  tests.push_back({"click_interceptor_stop_removes_listener", [] {
                     ClickHarness h;
                     h.interceptor.start();
                     h.interceptor.stop();
                     auto overlay = h.add_box("div", 0.9, 0.9);
                     dom::Event click("click");
                     require(h.document->dispatch_event(overlay, click), "click passes");
                     require(h.interceptor.intercepted() == 0, "listener removed");
                   }});
}
