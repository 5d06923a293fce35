#include "test_framework.hpp"

#include "domshield/config/config.hpp"
#include "domshield/dom/document.hpp"
#include "domshield/dom/errors.hpp"
#include "domshield/runtime/clock.hpp"
#include "domshield/runtime/page.hpp"
#include "domshield/settings/site_settings.hpp"
#include "domshield/shield/capability_interceptor.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace dom = domshield::dom;
namespace runtime = domshield::runtime;
namespace settings = domshield::settings;
namespace shield = domshield::shield;

// Records every call that reaches the wrapped table.
class RecordingCapabilities final : public dom::HostCapabilities {
public:
  std::optional<dom::BrowsingContext> open_context(const std::string &url,
                                                   const std::string &target) override {
    calls.push_back("open:" + url);
    return dom::BrowsingContext{url, target};
  }

  dom::ElementPtr append_child(const dom::ElementPtr &parent,
                               const dom::ElementPtr &child) override {
    calls.push_back("append");
    return parent->append_child(child);
  }

  void set_attribute(const dom::ElementPtr &element, const std::string &name,
                     const std::string &value) override {
    calls.push_back("attr:" + name);
    element->set_attribute(name, value);
  }

  void insert_markup(const dom::ElementPtr &, dom::InsertPosition,
                     const std::string &markup) override {
    calls.push_back("markup:" + std::to_string(markup.size()));
  }

  std::vector<std::string> calls;
};

settings::ResolvedSite advanced_site() {
  settings::ResolvedSite site;
  site.domain = "a.test";
  site.mode = settings::FilteringMode::Advanced;
  return site;
}

std::string marked_fragment(std::size_t length) {
  std::string out = "<div data-izone=\"1\">";
  out.resize(length, 'x');
  return out;
}

} // namespace

void register_capability_interceptor_tests(std::vector<domshield::tests::TestCase> &tests) {
  using domshield::tests::require;

  tests.push_back({"interceptor_blocks_ad_network_navigation", [] {
                     using shield::CapabilityInterceptor;
                     require(CapabilityInterceptor::should_block_navigation(
                                 "https://ads.exoclick.com/x"),
                             "ad network blocked");
                     require(CapabilityInterceptor::should_block_navigation(
                                 "https://cdn.example.com/PopUnder.js"),
                             "pop-under keyword blocked");
                     require(!CapabilityInterceptor::should_block_navigation(""), "empty url");
                     require(!CapabilityInterceptor::should_block_navigation("about:blank"),
                             "about:blank");
                     require(!CapabilityInterceptor::should_block_navigation("blob:abcd"), "blob");
                     require(!CapabilityInterceptor::should_block_navigation(
                                 "https://news.example.com/story"),
                             "ordinary page");

                     auto recorder = std::make_shared<RecordingCapabilities>();
                     CapabilityInterceptor interceptor(recorder);
                     const auto blocked =
                         interceptor.open_context("https://adsterra.com/pop", "_blank");
                     require(!blocked.has_value(), "no context opened");
                     const auto allowed =
                         interceptor.open_context("https://example.com/", "_blank");
                     require(allowed.has_value(), "allowed navigation passes through");
                     require(recorder->calls == std::vector<std::string>{
                                                    "open:https://example.com/"},
                             "only the allowed call reached the host");
                     require(interceptor.stats().blocked_navigations == 1, "blocked counter");
                   }});

  tests.push_back({"interceptor_blocks_large_marked_markup", [] {
                     using shield::CapabilityInterceptor;
                     require(CapabilityInterceptor::should_block_markup(marked_fragment(250)),
                             "large marked fragment blocked");
                     require(!CapabilityInterceptor::should_block_markup(marked_fragment(150)),
                             "short fragment allowed");
                     require(!CapabilityInterceptor::should_block_markup(
                                 std::string(400, 'a')),
                             "unmarked fragment allowed");

                     auto document = dom::Document::create();
                     auto recorder = std::make_shared<RecordingCapabilities>();
                     CapabilityInterceptor interceptor(recorder);
                     interceptor.insert_markup(document->body(), dom::InsertPosition::BeforeEnd,
                                               marked_fragment(250));
                     interceptor.insert_markup(document->body(), dom::InsertPosition::BeforeEnd,
                                               "<p>hi</p>");
                     require(recorder->calls == std::vector<std::string>{"markup:9"},
                             "blocked fragment never reached the host");
                     require(interceptor.stats().blocked_markup == 1, "blocked counter");
                   }});

  tests.push_back({"interceptor_suppresses_marked_elements_before_insertion", [] {
                     auto document = dom::Document::create();
                     auto recorder = std::make_shared<RecordingCapabilities>();
                     shield::CapabilityInterceptor interceptor(recorder);

                     auto slot = document->create_element("div");
                     slot->set_attribute("class", "sideAdSlot");
                     interceptor.append_child(document->body(), slot);
                     require(slot->parent() == document->body(), "insertion still happens");
                     require(slot->style_property("display") == std::string("none"),
                             "marked element suppressed");

                     auto plain = document->create_element("div");
                     interceptor.append_child(document->body(), plain);
                     require(!plain->style_property("display").has_value(), "plain untouched");

                     interceptor.set_attribute(plain, "DATA-ELEMENT", "late");
                     require(plain->style_property("visibility") == std::string("hidden"),
                             "marker attribute suppresses");
                     require(interceptor.stats().suppressed_elements == 2, "suppressed counter");
                   }});

  tests.push_back({"interceptor_propagates_host_errors", [] {
                     auto document = dom::Document::create();
                     shield::CapabilityInterceptor interceptor(nullptr);
                     bool threw = false;
                     try {
                       (void)interceptor.append_child(nullptr, document->create_element("p"));
                     } catch (const dom::HierarchyError &) {
                       threw = true;
                     }
                     require(threw, "native table error reaches the caller");
                   }});

  tests.push_back({"interceptor_installs_once_per_context", [] {
                     runtime::ManualClock clock;
                     runtime::Page page(dom::Document::create(), clock, {"https://a.test/"});
                     const auto original = page.document().capabilities();

                     require(shield::install_capability_interceptor(page, advanced_site()) ==
                                 shield::InstallOutcome::Installed,
                             "first install");
                     const auto installed = page.document().capabilities();
                     require(installed != original, "table replaced");
                     require(shield::install_capability_interceptor(page, advanced_site()) ==
                                 shield::InstallOutcome::AlreadyInstalled,
                             "second install refused");
                     require(page.document().capabilities() == installed, "not wrapped twice");

                     auto wrapper =
                         std::dynamic_pointer_cast<shield::CapabilityInterceptor>(installed);
                     require(wrapper && wrapper->delegate() == original,
                             "previous table kept as delegate");
                   }});

  tests.push_back({"interceptor_install_respects_frames_and_settings", [] {
                     runtime::ManualClock clock;
                     runtime::Page nested(dom::Document::create({}, false), clock);
                     require(shield::install_capability_interceptor(nested, advanced_site()) ==
                                 shield::InstallOutcome::SkippedNestedFrame,
                             "nested frame skipped");
                     domshield::config::EngineConfig engine;
                     engine.allow_nested_frames = true;
                     require(shield::install_capability_interceptor(nested, advanced_site(),
                                                                    engine) ==
                                 shield::InstallOutcome::Installed,
                             "nested frames allowed by config");

                     runtime::Page page(dom::Document::create(), clock);
                     auto lite = advanced_site();
                     lite.mode = settings::FilteringMode::Lite;
                     require(shield::install_capability_interceptor(page, lite) ==
                                 shield::InstallOutcome::SkippedBySettings,
                             "lite mode skipped");
                     auto off = advanced_site();
                     off.site.main_world_off = true;
                     require(shield::install_capability_interceptor(page, off) ==
                                 shield::InstallOutcome::SkippedBySettings,
                             "main world off skipped");
                     auto relaxed = advanced_site();
                     relaxed.relaxed = true;
                     require(shield::install_capability_interceptor(page, relaxed) ==
                                 shield::InstallOutcome::SkippedBySettings,
                             "relaxed site skipped");
                     require(!page.has_init_token(shield::CAPABILITY_INIT_TOKEN),
                             "skips do not claim the token");
                   }});
}
