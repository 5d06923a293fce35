#include "domshield/dom/element.hpp"

#include "domshield/common/string_util.hpp"
#include "domshield/dom/document.hpp"
#include "domshield/dom/errors.hpp"
#include "domshield/dom/selector.hpp"

#include <algorithm>

namespace domshield::dom {

namespace {

ListenerId next_listener_id() {
  static ListenerId counter = 0;
  return ++counter;
}

// Pre-order walk over the descendants of `root`, excluding `root`. Stops when `visit`
// returns false.
template <typename Visitor> void walk_descendants(const Element &root, Visitor &&visit) {
  std::vector<ElementPtr> stack(root.children().rbegin(), root.children().rend());
  while (!stack.empty()) {
    ElementPtr current = std::move(stack.back());
    stack.pop_back();
    if (!visit(current)) {
      return;
    }
    const auto &children = current->children();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back(*it);
    }
  }
}

} // namespace

Element::Element(std::string tag_name, std::weak_ptr<Document> document)
    : tag_name_(common::to_lower(std::move(tag_name))), document_(std::move(document)) {}

// ---------------------------------------------------------------------------
// Attributes
// ---------------------------------------------------------------------------

std::optional<std::string> Element::get_attribute(std::string_view name) const {
  const std::string lower = common::to_lower(std::string(name));
  for (const auto &[key, value] : attributes_) {
    if (key == lower) {
      return value;
    }
  }
  return std::nullopt;
}

bool Element::has_attribute(std::string_view name) const {
  return get_attribute(name).has_value();
}

void Element::set_attribute(const std::string &name, const std::string &value) {
  const std::string lower = common::to_lower(name);
  for (auto &[key, current] : attributes_) {
    if (key == lower) {
      std::optional<std::string> old_value = current;
      current = value;
      record_attribute_change(lower, std::move(old_value));
      return;
    }
  }
  attributes_.emplace_back(lower, value);
  record_attribute_change(lower, std::nullopt);
}

void Element::remove_attribute(std::string_view name) {
  const std::string lower = common::to_lower(std::string(name));
  const auto it = std::find_if(attributes_.begin(), attributes_.end(),
                               [&](const auto &entry) { return entry.first == lower; });
  if (it == attributes_.end()) {
    return;
  }
  std::optional<std::string> old_value = it->second;
  attributes_.erase(it);
  record_attribute_change(lower, std::move(old_value));
}

std::string Element::id() const { return get_attribute("id").value_or(""); }

std::string Element::class_name() const { return get_attribute("class").value_or(""); }

std::vector<std::string> Element::class_list() const {
  return common::split_whitespace(class_name());
}

void Element::record_attribute_change(const std::string &name,
                                      std::optional<std::string> old_value) {
  auto document = document_.lock();
  if (!document) {
    return;
  }
  MutationRecord record;
  record.type = MutationRecord::Type::Attributes;
  record.target = shared_from_this();
  record.attribute_name = name;
  record.old_value = std::move(old_value);
  document->queue_mutation(std::move(record));
}

// ---------------------------------------------------------------------------
// Style
// ---------------------------------------------------------------------------

std::optional<std::string> Element::style_property(std::string_view name) const {
  const auto css_text = get_attribute("style");
  if (!css_text.has_value()) {
    return std::nullopt;
  }
  const InlineStyle style = InlineStyle::parse(*css_text);
  const StyleDeclaration *decl = style.find(common::to_lower(std::string(name)));
  if (decl == nullptr) {
    return std::nullopt;
  }
  return decl->value;
}

void Element::set_style_property(const std::string &name, const std::string &value,
                                 const bool important) {
  InlineStyle style = InlineStyle::parse(get_attribute("style").value_or(""));
  style.set(common::to_lower(name), value, important);
  set_inline_style_text(style.serialize());
}

void Element::set_inline_style_text(const std::string &css_text) {
  set_attribute("style", css_text);
}

ComputedStyle Element::computed_style() const {
  if (!is_connected()) {
    throw DetachedNodeError("computed style requested for detached <" + tag_name_ + ">");
  }
  ComputedStyle out;
  out.position = layout_.position;
  out.z_index = layout_.z_index;
  out.display = layout_.display;

  const auto css_text = get_attribute("style");
  if (!css_text.has_value()) {
    return out;
  }
  const InlineStyle style = InlineStyle::parse(*css_text);
  if (const auto *decl = style.find("position")) {
    out.position = parse_position(decl->value);
  }
  if (const auto *decl = style.find("z-index")) {
    out.z_index = decl->value;
  }
  if (const auto *decl = style.find("display")) {
    out.display = decl->value;
  }
  if (const auto *decl = style.find("visibility")) {
    out.visibility = decl->value;
  }
  if (const auto *decl = style.find("pointer-events")) {
    out.pointer_events = decl->value;
  }
  return out;
}

Rect Element::bounding_client_rect() const {
  if (!is_connected()) {
    return {};
  }
  const Element *current = this;
  while (current != nullptr) {
    if (current->layout_.display == "none" || current->style_property("display") == "none") {
      return {};
    }
    const auto parent = current->parent_.lock();
    current = parent.get();
  }
  return layout_.rect;
}

// ---------------------------------------------------------------------------
// Tree
// ---------------------------------------------------------------------------

bool Element::is_connected() const {
  const Element *current = this;
  ElementPtr holder;
  while (true) {
    if (current->is_root_) {
      return !current->document_.expired();
    }
    holder = current->parent_.lock();
    if (!holder) {
      return false;
    }
    current = holder.get();
  }
}

ElementPtr Element::append_child(const ElementPtr &child) {
  return insert_before(child, nullptr);
}

ElementPtr Element::insert_before(const ElementPtr &child, const ElementPtr &reference) {
  if (!child) {
    throw HierarchyError("cannot insert a null element");
  }
  if (child->document_.lock() != document_.lock()) {
    throw HierarchyError("<" + child->tag_name_ + "> belongs to another document");
  }
  if (child->is_root_ || child->contains(*this)) {
    throw HierarchyError("inserting <" + child->tag_name_ + "> would create a cycle");
  }
  if (reference && reference->parent_.lock().get() != this) {
    throw HierarchyError("reference node is not a child of <" + tag_name_ + ">");
  }
  if (child == reference) {
    return child;
  }

  child->remove();

  auto position = children_.end();
  if (reference) {
    position = std::find(children_.begin(), children_.end(), reference);
  }
  children_.insert(position, child);
  child->parent_ = weak_from_this();

  if (auto document = document_.lock()) {
    MutationRecord record;
    record.type = MutationRecord::Type::ChildList;
    record.target = shared_from_this();
    record.added.push_back(child);
    document->queue_mutation(std::move(record));
  }
  return child;
}

void Element::remove() {
  auto parent = parent_.lock();
  if (!parent) {
    return;
  }
  auto self = shared_from_this();
  auto &siblings = parent->children_;
  siblings.erase(std::remove(siblings.begin(), siblings.end(), self), siblings.end());
  parent_.reset();

  if (auto document = document_.lock()) {
    MutationRecord record;
    record.type = MutationRecord::Type::ChildList;
    record.target = parent;
    record.removed.push_back(self);
    document->queue_mutation(std::move(record));
  }
}

bool Element::contains(const Element &other) const {
  const Element *current = &other;
  ElementPtr holder;
  while (current != nullptr) {
    if (current == this) {
      return true;
    }
    holder = current->parent_.lock();
    current = holder.get();
  }
  return false;
}

std::string Element::text_content() const {
  std::string out = text_;
  walk_descendants(*this, [&](const ElementPtr &node) {
    out += node->text_;
    return true;
  });
  return out;
}

// ---------------------------------------------------------------------------
// Selectors
// ---------------------------------------------------------------------------

bool Element::matches(const SelectorList &selectors) const { return selectors.matches(*this); }

ElementPtr Element::closest(const SelectorList &selectors) const {
  ElementPtr current = std::const_pointer_cast<Element>(shared_from_this());
  while (current) {
    if (selectors.matches(*current)) {
      return current;
    }
    current = current->parent();
  }
  return nullptr;
}

ElementPtr Element::query_selector(const SelectorList &selectors) const {
  ElementPtr found;
  walk_descendants(*this, [&](const ElementPtr &node) {
    if (selectors.matches(*node)) {
      found = node;
      return false;
    }
    return true;
  });
  return found;
}

std::vector<ElementPtr> Element::query_selector_all(const SelectorList &selectors) const {
  std::vector<ElementPtr> out;
  walk_descendants(*this, [&](const ElementPtr &node) {
    if (selectors.matches(*node)) {
      out.push_back(node);
    }
    return true;
  });
  return out;
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

ListenerId Element::add_event_listener(const std::string &type, EventListener listener,
                                       const bool capture) {
  const ListenerId id = next_listener_id();
  listeners_.push_back({id, type, std::move(listener), capture});
  return id;
}

void Element::remove_event_listener(const ListenerId id) {
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const RegisteredListener &entry) {
                                    return entry.id == id;
                                  }),
                   listeners_.end());
}

} // namespace domshield::dom
