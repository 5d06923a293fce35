#pragma once

#include "domshield/dom/element.hpp"

#include <cstdint>

namespace domshield::shield {

class ProcessedSet;
class RemovalQueue;

/// Local counters. They are never sent anywhere.
struct Counters {
  std::uint64_t hides = 0;
  std::uint64_t heuristic_removals = 0;
  std::uint64_t batches = 0;
};

/// The hide primitive shared by every detector: suppress now, detach later.
class Suppressor {
public:
  Suppressor(ProcessedSet &processed, RemovalQueue &queue, Counters &counters);

  /// Suppresses, records and enqueues `element`. False when it was already processed.
  bool hide(const dom::ElementPtr &element);

  /// Forces `display: none` and `visibility: hidden` with !important.
  static void suppress_style(dom::Element &element);

  [[nodiscard]] Counters &counters() { return counters_; }
  [[nodiscard]] const Counters &counters() const { return counters_; }
  [[nodiscard]] const ProcessedSet &processed() const { return processed_; }

private:
  ProcessedSet &processed_;
  RemovalQueue &queue_;
  Counters &counters_;
};

} // namespace domshield::shield
