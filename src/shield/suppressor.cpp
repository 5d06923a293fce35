#include "domshield/shield/suppressor.hpp"

#include "domshield/shield/processed_set.hpp"
#include "domshield/shield/removal_queue.hpp"

namespace domshield::shield {

Suppressor::Suppressor(ProcessedSet &processed, RemovalQueue &queue, Counters &counters)
    : processed_(processed), queue_(queue), counters_(counters) {}

void Suppressor::suppress_style(dom::Element &element) {
  element.set_style_property("display", "none", true);
  element.set_style_property("visibility", "hidden", true);
}

bool Suppressor::hide(const dom::ElementPtr &element) {
  if (!element || !processed_.insert(element)) {
    return false;
  }
  suppress_style(*element);
  ++counters_.hides;
  queue_.enqueue(element);
  return true;
}

} // namespace domshield::shield
