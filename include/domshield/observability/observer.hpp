#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace domshield::observability {

enum class Level { Debug = 0, Info = 1, Error = 2 };

[[nodiscard]] std::string_view level_name(Level level);
[[nodiscard]] Level parse_level(std::string_view name, Level fallback = Level::Info);

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record(Level level, std::string_view component, std::string_view message) = 0;
  virtual void flush() {}
};

class NoopObserver final : public IObserver {
public:
  void record(Level, std::string_view, std::string_view) override {}
};

/// Writes `<timestamp> [level] component: message` lines. Output stays on this machine.
class LogObserver final : public IObserver {
public:
  LogObserver(std::ostream &out, Level min_level);

  void record(Level level, std::string_view component, std::string_view message) override;
  void flush() override;

private:
  std::mutex mutex_;
  std::ostream &out_;
  Level min_level_;
};

} // namespace domshield::observability
