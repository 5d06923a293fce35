#include "domshield/shield/processed_set.hpp"

namespace domshield::shield {

bool ProcessedSet::contains(const dom::Element &element) const {
  const auto it = entries_.find(&element);
  if (it == entries_.end()) {
    return false;
  }
  // A recycled address belongs to a different element.
  const auto live = it->second.lock();
  return live && live.get() == &element;
}

bool ProcessedSet::insert(const dom::ElementPtr &element) {
  if (!element) {
    return false;
  }
  auto [it, inserted] = entries_.try_emplace(element.get(), element);
  if (inserted) {
    return true;
  }
  if (it->second.lock() == element) {
    return false;
  }
  it->second = element;
  return true;
}

std::size_t ProcessedSet::prune() {
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    // Detached elements stay: a host script may re-insert them.
    if (it->second.expired()) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

} // namespace domshield::shield
