#pragma once

#include "domshield/dom/document.hpp"
#include "domshield/dom/selector.hpp"
#include "domshield/shield/suppressor.hpp"

namespace domshield::shield {

struct ClickInterceptorOptions {
  int min_z_index = 11;
  /// Minimum share of the viewport the target must cover in each dimension.
  double min_viewport_fraction = 0.4;
};

/// Capture-phase click listener that swallows clicks on large positioned overlays and
/// hides them.
class ClickInterceptor {
public:
  ClickInterceptor(dom::Document &document, Suppressor &suppressor,
                   ClickInterceptorOptions options = {});
  ~ClickInterceptor();

  ClickInterceptor(const ClickInterceptor &) = delete;
  ClickInterceptor &operator=(const ClickInterceptor &) = delete;

  void start();
  void stop();

  /// True when the click was intercepted.
  bool handle_click(dom::Event &event);

  [[nodiscard]] std::size_t intercepted() const { return intercepted_; }

private:
  [[nodiscard]] bool is_blocking_overlay(const dom::Element &target) const;

  dom::Document &document_;
  Suppressor &suppressor_;
  ClickInterceptorOptions options_;
  dom::SelectorList safe_selector_;
  dom::ListenerId listener_ = 0;
  std::size_t intercepted_ = 0;
};

} // namespace domshield::shield
