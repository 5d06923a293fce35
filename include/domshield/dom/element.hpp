#pragma once

#include "domshield/dom/events.hpp"
#include "domshield/dom/geometry.hpp"
#include "domshield/dom/style.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace domshield::dom {

class Document;
class Element;
class SelectorList;

using ElementPtr = std::shared_ptr<Element>;
using WeakElementPtr = std::weak_ptr<Element>;

/// Layout values the host engine computed for an element. Inline style overrides them.
struct LayoutBox {
  Position position = Position::Static;
  std::string z_index = "auto";
  Rect rect;
  std::string display = "block";
};

/// A node in the host tree. Children are owned by their parent; the root is owned by the
/// Document. Create through Document::create_element.
class Element : public std::enable_shared_from_this<Element> {
public:
  Element(std::string tag_name, std::weak_ptr<Document> document);

  Element(const Element &) = delete;
  Element &operator=(const Element &) = delete;

  [[nodiscard]] const std::string &tag_name() const { return tag_name_; }
  [[nodiscard]] std::shared_ptr<Document> owner_document() const { return document_.lock(); }

  // Attributes -------------------------------------------------------------
  [[nodiscard]] std::optional<std::string> get_attribute(std::string_view name) const;
  [[nodiscard]] bool has_attribute(std::string_view name) const;
  void set_attribute(const std::string &name, const std::string &value);
  void remove_attribute(std::string_view name);
  [[nodiscard]] const std::vector<std::pair<std::string, std::string>> &attributes() const {
    return attributes_;
  }

  [[nodiscard]] std::string id() const;
  [[nodiscard]] std::string class_name() const;
  [[nodiscard]] std::vector<std::string> class_list() const;

  // Style ------------------------------------------------------------------
  [[nodiscard]] std::optional<std::string> style_property(std::string_view name) const;
  void set_style_property(const std::string &name, const std::string &value,
                          bool important = false);

  void set_layout(LayoutBox layout) { layout_ = std::move(layout); }
  [[nodiscard]] const LayoutBox &layout() const { return layout_; }

  /// Throws DetachedNodeError when the element is not connected.
  [[nodiscard]] ComputedStyle computed_style() const;

  /// Empty when disconnected or when the element or an ancestor is display:none.
  [[nodiscard]] Rect bounding_client_rect() const;

  // Tree -------------------------------------------------------------------
  [[nodiscard]] ElementPtr parent() const { return parent_.lock(); }
  [[nodiscard]] const std::vector<ElementPtr> &children() const { return children_; }
  [[nodiscard]] bool is_connected() const;

  /// Moves `child` under this element. Throws HierarchyError on cycles or foreign documents.
  ElementPtr append_child(const ElementPtr &child);
  ElementPtr insert_before(const ElementPtr &child, const ElementPtr &reference);
  /// Detaches this element from its parent. No-op when already detached.
  void remove();

  /// Inclusive: an element contains itself.
  [[nodiscard]] bool contains(const Element &other) const;

  void set_text(std::string text) { text_ = std::move(text); }
  [[nodiscard]] const std::string &own_text() const { return text_; }
  /// Own text followed by descendant text, in document order.
  [[nodiscard]] std::string text_content() const;

  // Selectors --------------------------------------------------------------
  [[nodiscard]] bool matches(const SelectorList &selectors) const;
  [[nodiscard]] ElementPtr closest(const SelectorList &selectors) const;
  [[nodiscard]] ElementPtr query_selector(const SelectorList &selectors) const;
  [[nodiscard]] std::vector<ElementPtr> query_selector_all(const SelectorList &selectors) const;

  // Events -----------------------------------------------------------------
  ListenerId add_event_listener(const std::string &type, EventListener listener,
                                bool capture = false);
  void remove_event_listener(ListenerId id);
  [[nodiscard]] const std::vector<RegisteredListener> &listeners() const { return listeners_; }

private:
  friend class Document;

  void record_attribute_change(const std::string &name, std::optional<std::string> old_value);
  void set_inline_style_text(const std::string &css_text);

  std::string tag_name_;
  std::weak_ptr<Document> document_;
  std::vector<std::pair<std::string, std::string>> attributes_;
  WeakElementPtr parent_;
  std::vector<ElementPtr> children_;
  LayoutBox layout_;
  std::string text_;
  std::vector<RegisteredListener> listeners_;
  bool is_root_ = false;
};

} // namespace domshield::dom
