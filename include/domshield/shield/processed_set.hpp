#pragma once

#include "domshield/dom/element.hpp"

#include <cstddef>
#include <unordered_map>

namespace domshield::shield {

/// Identity set of elements already suppressed. Holds weak references only.
class ProcessedSet {
public:
  [[nodiscard]] bool contains(const dom::Element &element) const;
  /// False when the element is already present.
  bool insert(const dom::ElementPtr &element);
  /// Drops entries whose element expired.
  std::size_t prune();

  [[nodiscard]] std::size_t size() const { return entries_.size(); }

private:
  std::unordered_map<const dom::Element *, dom::WeakElementPtr> entries_;
};

} // namespace domshield::shield
