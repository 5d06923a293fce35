#include "domshield/shield/media_guard.hpp"

#include "domshield/dom/errors.hpp"
#include "domshield/observability/global.hpp"
#include "domshield/shield/markers.hpp"
#include "domshield/shield/processed_set.hpp"
#include "domshield/shield/rule_config.hpp"

#include <array>

namespace domshield::shield {

namespace {

constexpr const char *PLAYER_UI_SELECTOR =
    "video, main, article, .content, .video-player, nav, header, footer, "
    "[class*=\"player\"], [class*=\"controls\"], [class^=\"ytp-\"], [id*=\"player\"]";

constexpr std::array<const char *, 3> PLAYER_EVENTS = {"pause", "play", "fullscreenchange"};

} // namespace

MediaGuard::MediaGuard(runtime::Page &page, Suppressor &suppressor,
                       std::function<void()> fast_cleanup, MediaGuardOptions options)
    : page_(page), suppressor_(suppressor), fast_cleanup_(std::move(fast_cleanup)),
      options_(options), video_selector_(builtin_selector("video")),
      any_selector_(builtin_selector("*")),
      player_selector_(builtin_selector(PLAYER_UI_SELECTOR)) {}

MediaGuard::~MediaGuard() { stop(); }

void MediaGuard::start() {
  if (observer_) {
    return;
  }
  observer_ = std::make_shared<dom::MutationObserver>(
      [this](const std::vector<dom::MutationRecord> &records) { handle_mutations(records); });
  dom::MutationObserverInit init;
  init.child_list = true;
  init.subtree = true;
  observer_->observe(page_.document().document_element(), std::move(init));

  for (const auto &video : page_.document().query_selector_all(video_selector_)) {
    (void)guard(video);
  }
}

void MediaGuard::stop() {
  if (observer_) {
    observer_->disconnect();
    observer_.reset();
  }
  for (const auto &state : guarded_) {
    if (state->interval != 0) {
      page_.loop().clear_timer(state->interval);
    }
    if (auto video = state->video.lock()) {
      for (const auto id : state->listeners) {
        video->remove_event_listener(id);
      }
      video->remove_attribute(GUARDED_ATTR);
    }
  }
  guarded_.clear();
}

void MediaGuard::handle_mutations(const std::vector<dom::MutationRecord> &records) {
  for (const auto &record : records) {
    for (const auto &node : record.added) {
      if (node->tag_name() == "video") {
        (void)guard(node);
        continue;
      }
      for (const auto &video : node->query_selector_all(video_selector_)) {
        (void)guard(video);
      }
    }
  }
}

bool MediaGuard::guard(const dom::ElementPtr &video) {
  if (!video || video->tag_name() != "video" || video->has_attribute(GUARDED_ATTR)) {
    return false;
  }
  video->set_attribute(std::string(GUARDED_ATTR), "true");
  if (auto parent = video->parent()) {
    parent->set_style_property("pointer-events", "auto", true);
  }

  auto state = std::make_shared<GuardedVideo>();
  state->video = video;
  const dom::WeakElementPtr weak_video = video;
  const auto on_trigger = [this, weak_video](dom::Event &) {
    if (auto target = weak_video.lock()) {
      trigger(target);
    }
  };
  for (const char *type : PLAYER_EVENTS) {
    state->listeners.push_back(video->add_event_listener(type, on_trigger));
  }
  state->listeners.push_back(video->add_event_listener("click", on_trigger, true));
  guarded_.push_back(std::move(state));
  return true;
}

std::shared_ptr<MediaGuard::GuardedVideo> MediaGuard::find(const dom::Element &video) const {
  for (const auto &state : guarded_) {
    if (state->video.lock().get() == &video) {
      return state;
    }
  }
  return nullptr;
}

bool MediaGuard::alert_active(const dom::Element &video) const {
  const auto state = find(video);
  return state && state->alert_active;
}

void MediaGuard::trigger(const dom::ElementPtr &video) {
  auto state = find(*video);
  if (!state || state->alert_active) {
    return;
  }
  state->alert_active = true;
  state->sweeps_done = 0;

  const std::weak_ptr<GuardedVideo> weak_state = state;
  state->interval = page_.loop().set_interval(
      [this, weak_state]() {
        auto current = weak_state.lock();
        if (!current) {
          return;
        }
        auto target = current->video.lock();
        if (target) {
          sweep(target);
        }
        ++current->sweeps_done;
        if (!target || current->sweeps_done >= options_.sweep_repetitions) {
          page_.loop().clear_timer(current->interval);
          current->interval = 0;
          current->alert_active = false;
        }
      },
      options_.sweep_interval_ms);

  sweep(video);
}

void MediaGuard::sweep(const dom::ElementPtr &video) {
  if (fast_cleanup_) {
    fast_cleanup_();
  }
  if (video) {
    (void)sweep_overlays(*video);
  }
}

std::size_t MediaGuard::sweep_overlays(const dom::Element &video) {
  const dom::Rect video_rect = video.bounding_client_rect();
  if (video_rect.width < options_.min_video_size || video_rect.height < options_.min_video_size) {
    return 0;
  }

  std::size_t hidden = 0;
  const auto &processed = suppressor_.processed();
  for (const auto &element : page_.document().query_selector_all(any_selector_)) {
    if (processed.contains(*element) || element->contains(video)) {
      continue;
    }
    try {
      const auto style = element->computed_style();
      if (!style.is_out_of_flow()) {
        continue;
      }
      const auto z_index = style.z_index_value();
      if (!z_index.has_value() || *z_index < options_.min_overlay_z_index) {
        continue;
      }
    } catch (const dom::DetachedNodeError &) {
      continue;
    }
    if (!element->bounding_client_rect().intersects(video_rect) ||
        element->matches(player_selector_)) {
      continue;
    }
    if (suppressor_.hide(element)) {
      ++hidden;
    }
  }
  if (hidden > 0) {
    observability::record_debug("media", "hid " + std::to_string(hidden) + " overlays over video");
  }
  return hidden;
}

} // namespace domshield::shield
