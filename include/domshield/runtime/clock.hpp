#pragma once

#include <chrono>
#include <cstdint>

namespace domshield::runtime {

/// Milliseconds on a monotonic timeline. Only differences are meaningful.
using Millis = std::int64_t;

class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual Millis now_ms() const = 0;
};

class SteadyClock final : public Clock {
public:
  [[nodiscard]] Millis now_ms() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }
};

/// Clock driven by hand. `tick_per_read` advances time on every read, which lets a test
/// model work that takes time.
class ManualClock final : public Clock {
public:
  explicit ManualClock(Millis start = 0) : now_(start) {}

  [[nodiscard]] Millis now_ms() const override {
    const Millis current = now_;
    now_ += tick_per_read_;
    return current;
  }

  void advance(Millis delta) { now_ += delta; }
  void set(Millis value) { now_ = value; }
  void set_tick_per_read(Millis tick) { tick_per_read_ = tick; }

private:
  mutable Millis now_ = 0;
  Millis tick_per_read_ = 0;
};

} // namespace domshield::runtime
