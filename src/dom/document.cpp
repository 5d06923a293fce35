#include "domshield/dom/document.hpp"

#include "domshield/common/string_util.hpp"
#include "domshield/dom/errors.hpp"
#include "domshield/dom/selector.hpp"

#include <algorithm>

namespace domshield::dom {

namespace {

constexpr int MAX_DELIVERY_ROUNDS = 16;

} // namespace

// ---------------------------------------------------------------------------
// MutationObserver
// ---------------------------------------------------------------------------

MutationObserver::MutationObserver(MutationCallback callback) : callback_(std::move(callback)) {}

void MutationObserver::observe(const ElementPtr &target, MutationObserverInit init) {
  if (!target) {
    return;
  }
  target_ = target;
  init_ = std::move(init);
  for (auto &name : init_.attribute_filter) {
    name = common::to_lower(name);
  }
  if (!init_.attribute_filter.empty()) {
    init_.attributes = true;
  }
  if (auto document = target->owner_document()) {
    document->register_observer(shared_from_this());
  }
}

void MutationObserver::disconnect() {
  target_.reset();
  pending_.clear();
}

std::vector<MutationRecord> MutationObserver::take_records() {
  std::vector<MutationRecord> out;
  out.swap(pending_);
  return out;
}

bool MutationObserver::wants(const MutationRecord &record) const {
  const auto target = target_.lock();
  if (!target || !record.target) {
    return false;
  }
  if (record.type == MutationRecord::Type::ChildList && !init_.child_list) {
    return false;
  }
  if (record.type == MutationRecord::Type::Attributes) {
    if (!init_.attributes) {
      return false;
    }
    if (!init_.attribute_filter.empty() &&
        std::find(init_.attribute_filter.begin(), init_.attribute_filter.end(),
                  record.attribute_name) == init_.attribute_filter.end()) {
      return false;
    }
  }
  if (record.target == target) {
    return true;
  }
  return init_.subtree && target->contains(*record.target);
}

// ---------------------------------------------------------------------------
// Document
// ---------------------------------------------------------------------------

Document::Document(Viewport viewport, const bool top_level)
    : viewport_(viewport), top_level_(top_level),
      capabilities_(std::make_shared<NativeCapabilities>()) {}

std::shared_ptr<Document> Document::create(Viewport viewport, const bool top_level) {
  std::shared_ptr<Document> document(new Document(viewport, top_level));
  document->root_ = document->create_element("html");
  document->root_->is_root_ = true;
  document->head_ = document->create_element("head");
  document->body_ = document->create_element("body");
  document->root_->append_child(document->head_);
  document->root_->append_child(document->body_);
  return document;
}

ElementPtr Document::create_element(const std::string &tag_name) {
  return std::make_shared<Element>(tag_name, weak_from_this());
}

ElementPtr Document::get_element_by_id(std::string_view id) const {
  if (id.empty()) {
    return nullptr;
  }
  if (root_->id() == id) {
    return root_;
  }
  const auto selectors = SelectorList::parse("[id]");
  if (!selectors.ok()) {
    return nullptr;
  }
  for (const auto &element : root_->query_selector_all(selectors.value())) {
    if (element->id() == id) {
      return element;
    }
  }
  return nullptr;
}

std::vector<ElementPtr> Document::query_selector_all(const SelectorList &selectors) const {
  std::vector<ElementPtr> out;
  if (selectors.matches(*root_)) {
    out.push_back(root_);
  }
  auto descendants = root_->query_selector_all(selectors);
  out.insert(out.end(), descendants.begin(), descendants.end());
  return out;
}

void Document::set_capabilities(std::shared_ptr<HostCapabilities> capabilities) {
  if (capabilities) {
    capabilities_ = std::move(capabilities);
  }
}

// ---------------------------------------------------------------------------
// Mutation delivery
// ---------------------------------------------------------------------------

void Document::register_observer(const std::shared_ptr<MutationObserver> &observer) {
  for (const auto &existing : observers_) {
    if (existing.lock() == observer) {
      return;
    }
  }
  observers_.push_back(observer);
}

void Document::queue_mutation(MutationRecord record) {
  bool queued = false;
  for (const auto &weak : observers_) {
    auto observer = weak.lock();
    if (observer && observer->wants(record)) {
      observer->pending_.push_back(record);
      queued = true;
    }
  }
  if (queued && !delivery_scheduled_) {
    delivery_scheduled_ = true;
    if (delivery_hook_) {
      delivery_hook_();
    }
  }
}

void Document::set_mutation_delivery_hook(std::function<void()> hook) {
  delivery_hook_ = std::move(hook);
}

bool Document::has_pending_mutations() const {
  return std::any_of(observers_.begin(), observers_.end(), [](const auto &weak) {
    const auto observer = weak.lock();
    return observer && !observer->pending_.empty();
  });
}

void Document::flush_mutations() {
  for (int round = 0; round < MAX_DELIVERY_ROUNDS; ++round) {
    delivery_scheduled_ = false;
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                    [](const auto &weak) { return weak.expired(); }),
                     observers_.end());

    std::vector<std::shared_ptr<MutationObserver>> ready;
    for (const auto &weak : observers_) {
      auto observer = weak.lock();
      if (observer && !observer->pending_.empty()) {
        ready.push_back(std::move(observer));
      }
    }
    if (ready.empty()) {
      return;
    }
    for (const auto &observer : ready) {
      auto records = observer->take_records();
      if (!records.empty() && observer->callback_) {
        observer->callback_(records);
      }
    }
  }
  // Records still pending after the last round wait for the next delivery.
  if (has_pending_mutations() && !delivery_scheduled_) {
    delivery_scheduled_ = true;
    if (delivery_hook_) {
      delivery_hook_();
    }
  }
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

ListenerId Document::add_event_listener(const std::string &type, EventListener listener,
                                        const bool capture) {
  const ListenerId id = ++next_listener_id_;
  listeners_.push_back({id, type, std::move(listener), capture});
  return id;
}

void Document::remove_event_listener(const ListenerId id) {
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const RegisteredListener &entry) {
                                    return entry.id == id;
                                  }),
                   listeners_.end());
}

void Document::invoke(std::vector<RegisteredListener> listeners, Event &event,
                      const bool capture) {
  for (const auto &entry : listeners) {
    if (entry.type != event.type() || entry.capture != capture || !entry.callback) {
      continue;
    }
    entry.callback(event);
    if (event.immediate_propagation_stopped()) {
      return;
    }
  }
}

bool Document::dispatch_event(const ElementPtr &target, Event &event) {
  if (!target) {
    return true;
  }
  const bool connected = target->is_connected();
  std::vector<ElementPtr> path;
  for (auto node = target->parent(); node; node = node->parent()) {
    path.push_back(node);
  }

  event.target_ = target;
  event.phase_ = EventPhase::Capturing;
  event.current_target_.reset();
  if (connected) {
    invoke(listeners_, event, true);
  }
  for (auto it = path.rbegin(); it != path.rend() && !event.propagation_stopped(); ++it) {
    event.current_target_ = *it;
    invoke((*it)->listeners_, event, true);
  }

  if (!event.propagation_stopped()) {
    event.phase_ = EventPhase::AtTarget;
    event.current_target_ = target;
    invoke(target->listeners_, event, true);
    if (!event.immediate_propagation_stopped()) {
      invoke(target->listeners_, event, false);
    }
  }

  if (event.bubbles()) {
    event.phase_ = EventPhase::Bubbling;
    for (auto it = path.begin(); it != path.end() && !event.propagation_stopped(); ++it) {
      event.current_target_ = *it;
      invoke((*it)->listeners_, event, false);
    }
    if (connected && !event.propagation_stopped()) {
      event.current_target_.reset();
      invoke(listeners_, event, false);
    }
  }

  event.phase_ = EventPhase::None;
  event.current_target_.reset();
  return !event.default_prevented();
}

// ---------------------------------------------------------------------------
// NativeCapabilities
// ---------------------------------------------------------------------------

std::optional<BrowsingContext> NativeCapabilities::open_context(const std::string &url,
                                                                const std::string &target) {
  BrowsingContext context{url, target};
  opened_.push_back(context);
  return context;
}

ElementPtr NativeCapabilities::append_child(const ElementPtr &parent, const ElementPtr &child) {
  if (!parent) {
    throw HierarchyError("append_child called without a parent");
  }
  return parent->append_child(child);
}

void NativeCapabilities::set_attribute(const ElementPtr &element, const std::string &name,
                                       const std::string &value) {
  if (element) {
    element->set_attribute(name, value);
  }
}

void NativeCapabilities::insert_markup(const ElementPtr &element, const InsertPosition position,
                                       const std::string &markup) {
  if (!element) {
    throw HierarchyError("insert_markup called without an element");
  }
  auto document = element->owner_document();
  if (!document) {
    throw DomError("insert_markup on an element without a document");
  }
  auto fragment = document->create_element("template");
  fragment->set_text(markup);

  switch (position) {
  case InsertPosition::AfterBegin: {
    const auto &children = element->children();
    element->insert_before(fragment, children.empty() ? nullptr : children.front());
    return;
  }
  case InsertPosition::BeforeEnd:
    element->append_child(fragment);
    return;
  case InsertPosition::BeforeBegin:
  case InsertPosition::AfterEnd: {
    auto parent = element->parent();
    if (!parent) {
      throw HierarchyError("insert_markup outside a detached element");
    }
    ElementPtr reference = element;
    if (position == InsertPosition::AfterEnd) {
      const auto &siblings = parent->children();
      const auto it = std::find(siblings.begin(), siblings.end(), element);
      reference = (it == siblings.end() || it + 1 == siblings.end()) ? nullptr : *(it + 1);
    }
    parent->insert_before(fragment, reference);
    return;
  }
  }
}

} // namespace domshield::dom
