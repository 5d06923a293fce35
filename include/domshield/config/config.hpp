#pragma once

#include "domshield/common/result.hpp"
#include "domshield/settings/site_settings.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domshield::config {

struct ObservabilityConfig {
  std::string backend = "none";
  std::string level = "info";
};

struct EngineConfig {
  std::uint64_t budget_ms = 8;
  std::uint64_t quiet_threshold_ms = 10'000;
  std::uint64_t watcher_idle_timeout_ms = 200;
  std::uint64_t watcher_fallback_ms = 50;
  std::uint64_t removal_batch_size = 50;
  std::uint64_t removal_idle_timeout_ms = 500;
  std::uint64_t removal_fallback_ms = 100;
  std::uint64_t removal_cooldown_ms = 2'000;
  std::uint64_t heal_interval_ms = 8'000;
  bool merge_pending_batches = false;
  bool allow_nested_frames = false;
};

struct Config {
  ObservabilityConfig observability;
  EngineConfig engine;
  settings::SettingsSnapshot settings;
  /// Migration and parse notes collected by load_config.
  std::vector<std::string> load_warnings;
};

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();

void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Defaults when the file does not exist.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(std::string_view text);
/// Failure for values the engine cannot run with, warnings for everything else.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

[[nodiscard]] std::string render_config(const Config &config);

} // namespace domshield::config
