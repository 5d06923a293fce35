#pragma once

namespace domshield::dom {

struct Rect {
  double left = 0.0;
  double top = 0.0;
  double width = 0.0;
  double height = 0.0;

  [[nodiscard]] double right() const { return left + width; }
  [[nodiscard]] double bottom() const { return top + height; }

  /// Edge-touching boxes count as intersecting.
  [[nodiscard]] bool intersects(const Rect &other) const {
    return !(right() < other.left || left > other.right() || bottom() < other.top ||
             top > other.bottom());
  }
};

struct Viewport {
  double width = 1280.0;
  double height = 720.0;
};

} // namespace domshield::dom
