#pragma once

#include "domshield/dom/document.hpp"
#include "domshield/dom/selector.hpp"
#include "domshield/runtime/page.hpp"
#include "domshield/shield/suppressor.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace domshield::shield {

struct MediaGuardOptions {
  runtime::Millis sweep_interval_ms = 150;
  int sweep_repetitions = 13;
  /// Videos smaller than this in either dimension are not swept around.
  double min_video_size = 50.0;
  int min_overlay_z_index = 11;
};

/// Protects video elements: player interactions open a short high-alert window of sweeps
/// that hide positioned overlays covering the video.
class MediaGuard {
public:
  MediaGuard(runtime::Page &page, Suppressor &suppressor, std::function<void()> fast_cleanup,
             MediaGuardOptions options = {});
  ~MediaGuard();

  MediaGuard(const MediaGuard &) = delete;
  MediaGuard &operator=(const MediaGuard &) = delete;

  /// Guards existing videos and watches for new ones.
  void start();
  void stop();

  /// False when `video` is not a video or is already guarded.
  bool guard(const dom::ElementPtr &video);
  /// Starts a high-alert window unless one is active for `video`.
  void trigger(const dom::ElementPtr &video);
  /// Fast cleanup followed by the geometry sweep.
  void sweep(const dom::ElementPtr &video);
  /// Hides positioned overlays intersecting `video`. Returns the number hidden.
  std::size_t sweep_overlays(const dom::Element &video);

  [[nodiscard]] bool alert_active(const dom::Element &video) const;
  [[nodiscard]] std::size_t guarded_count() const { return guarded_.size(); }

private:
  struct GuardedVideo {
    dom::WeakElementPtr video;
    std::vector<dom::ListenerId> listeners;
    bool alert_active = false;
    int sweeps_done = 0;
    runtime::TimerId interval = 0;
  };

  void handle_mutations(const std::vector<dom::MutationRecord> &records);
  [[nodiscard]] std::shared_ptr<GuardedVideo> find(const dom::Element &video) const;

  runtime::Page &page_;
  Suppressor &suppressor_;
  std::function<void()> fast_cleanup_;
  MediaGuardOptions options_;
  std::shared_ptr<dom::MutationObserver> observer_;
  std::vector<std::shared_ptr<GuardedVideo>> guarded_;
  dom::SelectorList video_selector_;
  dom::SelectorList any_selector_;
  dom::SelectorList player_selector_;
};

} // namespace domshield::shield
