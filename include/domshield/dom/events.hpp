#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace domshield::dom {

class Element;

enum class EventPhase { None, Capturing, AtTarget, Bubbling };

class Event {
public:
  explicit Event(std::string type, bool bubbles = true)
      : type_(std::move(type)), bubbles_(bubbles) {}

  [[nodiscard]] const std::string &type() const { return type_; }
  [[nodiscard]] bool bubbles() const { return bubbles_; }
  [[nodiscard]] std::shared_ptr<Element> target() const { return target_.lock(); }
  [[nodiscard]] std::shared_ptr<Element> current_target() const { return current_target_.lock(); }
  [[nodiscard]] EventPhase phase() const { return phase_; }

  void prevent_default() { default_prevented_ = true; }
  [[nodiscard]] bool default_prevented() const { return default_prevented_; }

  void stop_propagation() { propagation_stopped_ = true; }
  void stop_immediate_propagation() {
    propagation_stopped_ = true;
    immediate_stopped_ = true;
  }
  [[nodiscard]] bool propagation_stopped() const { return propagation_stopped_; }
  [[nodiscard]] bool immediate_propagation_stopped() const { return immediate_stopped_; }

private:
  friend class Document;

  std::string type_;
  bool bubbles_ = true;
  std::weak_ptr<Element> target_;
  std::weak_ptr<Element> current_target_;
  EventPhase phase_ = EventPhase::None;
  bool default_prevented_ = false;
  bool propagation_stopped_ = false;
  bool immediate_stopped_ = false;
};

using EventListener = std::function<void(Event &)>;
using ListenerId = std::uint64_t;

struct RegisteredListener {
  ListenerId id = 0;
  std::string type;
  EventListener callback;
  bool capture = false;
};

} // namespace domshield::dom
