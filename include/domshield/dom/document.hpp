#pragma once

#include "domshield/dom/capabilities.hpp"
#include "domshield/dom/element.hpp"
#include "domshield/dom/events.hpp"
#include "domshield/dom/geometry.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domshield::dom {

class SelectorList;

struct MutationRecord {
  enum class Type { ChildList, Attributes };

  Type type = Type::ChildList;
  ElementPtr target;
  std::vector<ElementPtr> added;
  std::vector<ElementPtr> removed;
  std::string attribute_name;
  std::optional<std::string> old_value;
};

struct MutationObserverInit {
  bool child_list = false;
  bool attributes = false;
  bool subtree = false;
  /// When non-empty, only these attribute names produce records.
  std::vector<std::string> attribute_filter;
};

using MutationCallback = std::function<void(const std::vector<MutationRecord> &)>;

class MutationObserver : public std::enable_shared_from_this<MutationObserver> {
public:
  explicit MutationObserver(MutationCallback callback);

  /// Replaces any previous registration.
  void observe(const ElementPtr &target, MutationObserverInit init);
  void disconnect();
  [[nodiscard]] std::vector<MutationRecord> take_records();
  [[nodiscard]] bool is_observing() const { return !target_.expired(); }

private:
  friend class Document;

  [[nodiscard]] bool wants(const MutationRecord &record) const;

  MutationCallback callback_;
  WeakElementPtr target_;
  MutationObserverInit init_;
  std::vector<MutationRecord> pending_;
};

/// Owns the element tree (`html` with `head` and `body`), the capability table, mutation
/// observers and document-level listeners.
class Document : public std::enable_shared_from_this<Document> {
public:
  [[nodiscard]] static std::shared_ptr<Document> create(Viewport viewport = {},
                                                        bool top_level = true);

  Document(const Document &) = delete;
  Document &operator=(const Document &) = delete;

  [[nodiscard]] ElementPtr create_element(const std::string &tag_name);

  [[nodiscard]] ElementPtr document_element() const { return root_; }
  [[nodiscard]] ElementPtr head() const { return head_; }
  [[nodiscard]] ElementPtr body() const { return body_; }

  [[nodiscard]] ElementPtr get_element_by_id(std::string_view id) const;
  /// Matches the root element as well as its descendants.
  [[nodiscard]] std::vector<ElementPtr> query_selector_all(const SelectorList &selectors) const;

  [[nodiscard]] const Viewport &viewport() const { return viewport_; }
  void set_viewport(Viewport viewport) { viewport_ = viewport; }
  [[nodiscard]] bool is_top_level() const { return top_level_; }

  [[nodiscard]] std::shared_ptr<HostCapabilities> capabilities() const { return capabilities_; }
  void set_capabilities(std::shared_ptr<HostCapabilities> capabilities);

  // Mutation delivery ----------------------------------------------------------
  /// Called once each time records become pending after a flush.
  void set_mutation_delivery_hook(std::function<void()> hook);
  [[nodiscard]] bool has_pending_mutations() const;
  /// Delivers pending records to their observers, repeating while callbacks queue more.
  void flush_mutations();

  // Events ---------------------------------------------------------------------
  ListenerId add_event_listener(const std::string &type, EventListener listener,
                                bool capture = false);
  void remove_event_listener(ListenerId id);
  /// Capture from the document down, then the target, then bubble back up. Returns false
  /// when a listener prevented the default action.
  bool dispatch_event(const ElementPtr &target, Event &event);

private:
  friend class Element;
  friend class MutationObserver;

  Document(Viewport viewport, bool top_level);

  void queue_mutation(MutationRecord record);
  void register_observer(const std::shared_ptr<MutationObserver> &observer);
  static void invoke(std::vector<RegisteredListener> listeners, Event &event, bool capture);

  Viewport viewport_;
  bool top_level_ = true;
  ElementPtr root_;
  ElementPtr head_;
  ElementPtr body_;
  std::shared_ptr<HostCapabilities> capabilities_;
  std::vector<std::weak_ptr<MutationObserver>> observers_;
  std::function<void()> delivery_hook_;
  bool delivery_scheduled_ = false;
  std::vector<RegisteredListener> listeners_;
  ListenerId next_listener_id_ = 0;
};

} // namespace domshield::dom
