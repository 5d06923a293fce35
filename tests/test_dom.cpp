#include "test_framework.hpp"

#include "domshield/dom/document.hpp"
#include "domshield/dom/errors.hpp"
#include "domshield/dom/selector.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

domshield::dom::SelectorList selector(const std::string &text) {
  auto parsed = domshield::dom::SelectorList::parse(text);
  domshield::tests::require(parsed.ok(), parsed.error());
  return parsed.value();
}

} // namespace

void register_dom_tests(std::vector<domshield::tests::TestCase> &tests) {
  using domshield::tests::require;
  namespace dom = domshield::dom;

  tests.push_back({"selector_matches_compound_and_attribute_operators", [] {
                     auto document = dom::Document::create();
                     auto div = document->create_element("DIV");
                     div->set_attribute("id", "top");
                     div->set_attribute("class", "banner AdSlot wide");
                     div->set_attribute("data-izone", "header-left");
                     div->set_attribute("style", "position: fixed; z-index: 9");
                     document->body()->append_child(div);

                     require(div->tag_name() == "div", "tag names are lowercased");
                     require(div->matches(selector("div#top.banner.wide")), "compound");
                     require(div->matches(selector("[data-izone]")), "exists");
                     require(div->matches(selector("[data-izone=\"header-left\"]")), "equals");
                     require(div->matches(selector("[class~=AdSlot]")), "includes");
                     require(div->matches(selector("[data-izone|=header]")), "dash match");
                     require(div->matches(selector("[data-izone^=head]")), "prefix");
                     require(div->matches(selector("[data-izone$=left]")), "suffix");
                     require(div->matches(selector("div[style*=\"fixed\"]")), "substring");
                     require(!div->matches(selector("[class~=Ad]")), "includes is token based");
                     require(!div->matches(selector("span, #other")), "no alternative matches");
                     require(div->matches(selector("span, #top")), "list matches any");
                   }});

  tests.push_back({"selector_combinators_walk_ancestors", [] {
                     auto document = dom::Document::create();
                     auto outer = document->create_element("section");
                     outer->set_attribute("class", "feed");
                     auto middle = document->create_element("div");
                     auto leaf = document->create_element("a");
                     document->body()->append_child(outer);
                     outer->append_child(middle);
                     middle->append_child(leaf);

                     require(leaf->matches(selector(".feed a")), "descendant");
                     require(leaf->matches(selector("div > a")), "child");
                     require(!leaf->matches(selector(".feed > a")), "child needs direct parent");
                     require(leaf->matches(selector("body .feed>div>a")), "chained combinators");
                   }});

  tests.push_back({"selector_parse_rejects_malformed_input", [] {
                     require(!dom::SelectorList::parse("").ok(), "empty selector");
                     require(!dom::SelectorList::parse("div >").ok(), "dangling combinator");
                     require(!dom::SelectorList::parse("[data-x").ok(), "unterminated bracket");
                     require(!dom::SelectorList::parse("a:hover").ok(), "pseudo classes");
                     require(!dom::SelectorList::parse("div,").ok(), "empty list entry");
                     auto ok = dom::SelectorList::parse("a[title=\"x,y\"], b");
                     require(ok.ok(), ok.error());
                   }});

  tests.push_back({"query_selector_all_is_preorder_and_includes_root", [] {
                     auto document = dom::Document::create();
                     auto first = document->create_element("div");
                     auto nested = document->create_element("div");
                     auto second = document->create_element("div");
                     first->append_child(nested);
                     document->body()->append_child(first);
                     document->body()->append_child(second);

                     const auto found = document->query_selector_all(selector("div"));
                     require(found.size() == 3, "three divs expected");
                     require(found[0] == first && found[1] == nested && found[2] == second,
                             "document order expected");
                     require(document->query_selector_all(selector("html")).size() == 1,
                             "root element is searched");
                   }});

  tests.push_back({"insert_before_rejects_cycles_and_foreign_nodes", [] {
                     auto document = dom::Document::create();
                     auto other = dom::Document::create();
                     auto parent = document->create_element("div");
                     auto child = document->create_element("span");
                     parent->append_child(child);

                     bool threw = false;
                     try {
                       child->append_child(parent);
                     } catch (const dom::HierarchyError &) {
                       threw = true;
                     }
                     require(threw, "cycle must throw");

                     threw = false;
                     try {
                       parent->append_child(other->create_element("p"));
                     } catch (const dom::HierarchyError &) {
                       threw = true;
                     }
                     require(threw, "foreign element must throw");
                   }});

  tests.push_back({"computed_style_throws_for_detached_elements", [] {
                     auto document = dom::Document::create();
                     auto element = document->create_element("div");
                     bool threw = false;
                     try {
                       (void)element->computed_style();
                     } catch (const dom::DetachedNodeError &) {
                       threw = true;
                     }
                     require(threw, "detached read must throw");

                     document->body()->append_child(element);
                     element->set_style_property("position", "fixed", false);
                     element->set_style_property("z-index", "50", true);
                     const auto style = element->computed_style();
                     require(style.position == dom::Position::Fixed, "inline position wins");
                     require(style.z_index_value() == 50, "inline z-index wins");
                     require(element->get_attribute("style") ==
                                 std::string("position: fixed; z-index: 50 !important;"),
                             "style attribute is rewritten");
                   }});

  tests.push_back({"bounding_rect_is_empty_under_hidden_ancestor", [] {
                     auto document = dom::Document::create();
                     auto wrapper = document->create_element("div");
                     auto box = document->create_element("div");
                     dom::LayoutBox layout;
                     layout.rect = {10.0, 10.0, 200.0, 100.0};
                     box->set_layout(layout);
                     wrapper->append_child(box);
                     document->body()->append_child(wrapper);

                     require(box->bounding_client_rect().width == 200.0, "visible box");
                     wrapper->set_style_property("display", "none", true);
                     require(box->bounding_client_rect().width == 0.0, "hidden ancestor");
                   }});

  tests.push_back({"mutation_observer_batches_subtree_records", [] {
                     auto document = dom::Document::create();
                     int hook_calls = 0;
                     document->set_mutation_delivery_hook([&hook_calls] { ++hook_calls; });

                     std::vector<dom::MutationRecord> seen;
                     auto observer = std::make_shared<dom::MutationObserver>(
                         [&seen](const std::vector<dom::MutationRecord> &records) {
                           seen.insert(seen.end(), records.begin(), records.end());
                         });
                     dom::MutationObserverInit init;
                     init.child_list = true;
                     init.subtree = true;
                     init.attribute_filter = {"data-element"};
                     observer->observe(document->document_element(), init);

                     auto ad = document->create_element("div");
                     document->body()->append_child(ad);
                     ad->set_attribute("data-element", "x");
                     ad->set_attribute("title", "ignored");

                     require(hook_calls == 1, "one delivery per batch");
                     require(seen.empty(), "nothing delivered before flush");
                     document->flush_mutations();
                     require(seen.size() == 2, "childList and filtered attribute records");
                     require(seen[0].type == dom::MutationRecord::Type::ChildList,
                             "childList record first");
                     require(seen[0].added.size() == 1 && seen[0].added[0] == ad, "added node");
                     require(seen[1].attribute_name == "data-element", "filtered attribute");
                     require(!document->has_pending_mutations(), "queue drained");

                     observer->disconnect();
                     document->body()->append_child(document->create_element("p"));
                     document->flush_mutations();
                     require(seen.size() == 2, "disconnected observer gets nothing");
                   }});

  tests.push_back({"events_run_capture_before_bubble_and_honor_stop", [] {
                     auto document = dom::Document::create();
                     auto parent = document->create_element("div");
                     auto button = document->create_element("button");
                     parent->append_child(button);
                     document->body()->append_child(parent);

                     std::vector<std::string> order;
                     document->add_event_listener(
                         "click", [&order](dom::Event &) { order.push_back("doc-capture"); },
                         true);
                     parent->add_event_listener(
                         "click", [&order](dom::Event &) { order.push_back("parent-bubble"); });
                     button->add_event_listener(
                         "click", [&order](dom::Event &) { order.push_back("target"); });
                     document->add_event_listener(
                         "click", [&order](dom::Event &) { order.push_back("doc-bubble"); });

                     dom::Event click("click");
                     require(document->dispatch_event(button, click), "not cancelled");
                     require(order == std::vector<std::string>{"doc-capture", "target",
                                                               "parent-bubble", "doc-bubble"},
                             "dispatch order");

                     order.clear();
                     document->add_event_listener(
                         "click",
                         [](dom::Event &event) {
                           event.prevent_default();
                           event.stop_propagation();
                         },
                         true);
                     dom::Event blocked("click");
                     require(!document->dispatch_event(button, blocked), "default prevented");
                     require(order == std::vector<std::string>{"doc-capture"},
                             "propagation stopped at the document");
                   }});

  tests.push_back({"native_capabilities_insert_markup_positions", [] {
                     auto document = dom::Document::create();
                     auto anchor = document->create_element("div");
                     auto inner = document->create_element("span");
                     anchor->append_child(inner);
                     document->body()->append_child(anchor);
                     auto native = document->capabilities();

                     native->insert_markup(anchor, dom::InsertPosition::AfterBegin, "<b>a</b>");
                     require(anchor->children().size() == 2, "fragment inserted inside");
                     require(anchor->children().front()->tag_name() == "template",
                             "fragment placed first");
                     require(anchor->children().front()->own_text() == "<b>a</b>",
                             "markup kept as text");

                     native->insert_markup(anchor, dom::InsertPosition::AfterEnd, "tail");
                     const auto &siblings = document->body()->children();
                     require(siblings.size() == 2 && siblings.back()->own_text() == "tail",
                             "fragment placed after the element");

                     auto detached = document->create_element("div");
                     bool threw = false;
                     try {
                       native->insert_markup(detached, dom::InsertPosition::BeforeBegin, "x");
                     } catch (const dom::HierarchyError &) {
                       threw = true;
                     }
                     require(threw, "sibling insertion needs a parent");
                   }});
}
