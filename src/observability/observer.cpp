#include "domshield/observability/observer.hpp"

#include "domshield/common/string_util.hpp"

#include <ctime>
#include <iomanip>
#include <ostream>

namespace domshield::observability {

std::string_view level_name(const Level level) {
  switch (level) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Error:
    return "error";
  }
  return "info";
}

Level parse_level(std::string_view name, const Level fallback) {
  const std::string lower = common::to_lower(common::trim(std::string(name)));
  if (lower == "debug") {
    return Level::Debug;
  }
  if (lower == "info") {
    return Level::Info;
  }
  if (lower == "error") {
    return Level::Error;
  }
  return fallback;
}

LogObserver::LogObserver(std::ostream &out, const Level min_level)
    : out_(out), min_level_(min_level) {}

void LogObserver::record(const Level level, std::string_view component,
                         std::string_view message) {
  if (level < min_level_) {
    return;
  }
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);

  std::lock_guard<std::mutex> lock(mutex_);
  out_ << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " [" << level_name(level) << "] "
       << component << ": " << message << '\n';
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace domshield::observability
