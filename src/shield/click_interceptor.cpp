#include "domshield/shield/click_interceptor.hpp"

#include "domshield/dom/errors.hpp"
#include "domshield/observability/global.hpp"
#include "domshield/shield/rule_config.hpp"

namespace domshield::shield {

ClickInterceptor::ClickInterceptor(dom::Document &document, Suppressor &suppressor,
                                   ClickInterceptorOptions options)
    : document_(document), suppressor_(suppressor), options_(options),
      safe_selector_(
          builtin_selector("video, main, article, .content, .video-player, nav, form, dialog")) {}

ClickInterceptor::~ClickInterceptor() { stop(); }

void ClickInterceptor::start() {
  if (listener_ != 0) {
    return;
  }
  listener_ = document_.add_event_listener(
      "click", [this](dom::Event &event) { (void)handle_click(event); }, true);
}

void ClickInterceptor::stop() {
  if (listener_ != 0) {
    document_.remove_event_listener(listener_);
    listener_ = 0;
  }
}

bool ClickInterceptor::is_blocking_overlay(const dom::Element &target) const {
  try {
    const auto style = target.computed_style();
    if (!style.is_out_of_flow()) {
      return false;
    }
    const auto z_index = style.z_index_value();
    if (!z_index.has_value() || *z_index < options_.min_z_index) {
      return false;
    }
  } catch (const dom::DetachedNodeError &) {
    return false;
  }
  const auto rect = target.bounding_client_rect();
  const auto &viewport = document_.viewport();
  return rect.width >= viewport.width * options_.min_viewport_fraction &&
         rect.height >= viewport.height * options_.min_viewport_fraction &&
         !target.matches(safe_selector_);
}

bool ClickInterceptor::handle_click(dom::Event &event) {
  const auto target = event.target();
  if (!target || !is_blocking_overlay(*target)) {
    return false;
  }
  event.prevent_default();
  event.stop_propagation();
  (void)suppressor_.hide(target);
  ++intercepted_;
  observability::record_debug("click", "intercepted click on <" + target->tag_name() + ">");
  return true;
}

} // namespace domshield::shield
