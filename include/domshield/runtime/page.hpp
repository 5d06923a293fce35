#pragma once

#include "domshield/dom/document.hpp"
#include "domshield/runtime/clock.hpp"
#include "domshield/runtime/event_loop.hpp"
#include "domshield/runtime/idle_scheduler.hpp"

#include <memory>
#include <string>
#include <unordered_set>

namespace domshield::runtime {

struct PageOptions {
  std::string url;
  bool idle_supported = true;
};

/// One execution context: a document, its event loop and the initialization tokens claimed
/// in it. Mutation records are delivered as posted tasks on the loop.
class Page {
public:
  Page(std::shared_ptr<dom::Document> document, const Clock &clock, PageOptions options = {});
  ~Page();

  Page(const Page &) = delete;
  Page &operator=(const Page &) = delete;

  [[nodiscard]] dom::Document &document() { return *document_; }
  [[nodiscard]] const std::shared_ptr<dom::Document> &document_ptr() const { return document_; }
  [[nodiscard]] EventLoop &loop() { return loop_; }
  [[nodiscard]] IdleScheduler &idle() { return idle_; }
  [[nodiscard]] const Clock &clock() const { return clock_; }
  [[nodiscard]] const std::string &url() const { return url_; }

  /// True the first time `name` is claimed in this context, false afterwards.
  bool claim_init_token(const std::string &name);
  [[nodiscard]] bool has_init_token(const std::string &name) const;

  /// Runs posted tasks, pending mutation deliveries and due timers.
  std::size_t pump();

private:
  std::shared_ptr<dom::Document> document_;
  const Clock &clock_;
  EventLoop loop_;
  IdleScheduler idle_;
  std::string url_;
  std::unordered_set<std::string> init_tokens_;
};

} // namespace domshield::runtime
