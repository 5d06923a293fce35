#include "domshield/config/config.hpp"

#include "domshield/common/string_util.hpp"
#include "domshield/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace domshield::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".domshield";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("DOMSHIELD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

common::Result<std::string> read_config_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return common::Result<std::string>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return common::Result<std::string>::success(buffer.str());
}

void load_observability_config(Config &config, const common::TomlDocument &doc) {
  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));
}

void load_engine_config(Config &config, const common::TomlDocument &doc) {
  auto &engine = config.engine;
  engine.budget_ms = doc.get_u64("engine.budget_ms", engine.budget_ms);
  engine.quiet_threshold_ms = doc.get_u64("engine.quiet_threshold_ms", engine.quiet_threshold_ms);
  engine.watcher_idle_timeout_ms =
      doc.get_u64("engine.watcher_idle_timeout_ms", engine.watcher_idle_timeout_ms);
  engine.watcher_fallback_ms = doc.get_u64("engine.watcher_fallback_ms", engine.watcher_fallback_ms);
  engine.removal_batch_size = doc.get_u64("engine.removal_batch_size", engine.removal_batch_size);
  engine.removal_idle_timeout_ms =
      doc.get_u64("engine.removal_idle_timeout_ms", engine.removal_idle_timeout_ms);
  engine.removal_fallback_ms = doc.get_u64("engine.removal_fallback_ms", engine.removal_fallback_ms);
  engine.removal_cooldown_ms = doc.get_u64("engine.removal_cooldown_ms", engine.removal_cooldown_ms);
  engine.heal_interval_ms = doc.get_u64("engine.heal_interval_ms", engine.heal_interval_ms);
  engine.merge_pending_batches =
      doc.get_bool("engine.merge_pending_batches", engine.merge_pending_batches);
  engine.allow_nested_frames = doc.get_bool("engine.allow_nested_frames", engine.allow_nested_frames);
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }

  const std::string home = common::home_dir();
  if (home.empty()) {
    return common::Result<std::filesystem::path>::failure("HOME is not set");
  }
  return common::Result<std::filesystem::path>::success(std::filesystem::path(home) /
                                                        CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<Config> parse_config(std::string_view text) {
  const auto parsed = common::parse_toml(text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  load_observability_config(config, doc);
  load_engine_config(config, doc);
  config.settings = settings::load_snapshot(doc, config.load_warnings);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<Config>::success(Config{});
  }

  auto text = read_config_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure(text.error());
  }
  auto config = parse_config(text.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings = config.load_warnings;

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }
  const std::string level = common::to_lower(config.observability.level);
  if (level != "debug" && level != "info" && level != "error") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.level: " +
                                                              config.observability.level);
  }

  const auto &engine = config.engine;
  if (engine.budget_ms == 0) {
    return common::Result<std::vector<std::string>>::failure("engine.budget_ms must be >= 1");
  }
  if (engine.budget_ms > 16) {
    warnings.push_back("engine.budget_ms above 16 can drop frames on the host page");
  }
  if (engine.removal_batch_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "engine.removal_batch_size must be >= 1");
  }
  if (engine.heal_interval_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "engine.heal_interval_ms must be >= 1");
  }
  if (engine.watcher_fallback_ms > engine.watcher_idle_timeout_ms) {
    warnings.push_back("engine.watcher_fallback_ms is larger than engine.watcher_idle_timeout_ms");
  }
  if (engine.removal_fallback_ms > engine.removal_idle_timeout_ms) {
    warnings.push_back("engine.removal_fallback_ms is larger than engine.removal_idle_timeout_ms");
  }
  if (engine.merge_pending_batches) {
    warnings.push_back("engine.merge_pending_batches is enabled; deferred passes may grow large");
  }

  if (!config.settings.mode.has_value()) {
    warnings.push_back("settings.mode not set; sites without a mode run in lite mode");
  }
  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "level = " << common::quote_toml_string(config.observability.level) << "\n";

  const auto &engine = config.engine;
  out << "\n[engine]\n";
  out << "budget_ms = " << engine.budget_ms << "\n";
  out << "quiet_threshold_ms = " << engine.quiet_threshold_ms << "\n";
  out << "watcher_idle_timeout_ms = " << engine.watcher_idle_timeout_ms << "\n";
  out << "watcher_fallback_ms = " << engine.watcher_fallback_ms << "\n";
  out << "removal_batch_size = " << engine.removal_batch_size << "\n";
  out << "removal_idle_timeout_ms = " << engine.removal_idle_timeout_ms << "\n";
  out << "removal_fallback_ms = " << engine.removal_fallback_ms << "\n";
  out << "removal_cooldown_ms = " << engine.removal_cooldown_ms << "\n";
  out << "heal_interval_ms = " << engine.heal_interval_ms << "\n";
  out << "merge_pending_batches = " << bool_to_toml(engine.merge_pending_batches) << "\n";
  out << "allow_nested_frames = " << bool_to_toml(engine.allow_nested_frames) << "\n";

  out << "\n[settings]\n";
  if (config.settings.mode.has_value()) {
    out << "mode = "
        << common::quote_toml_string(std::string(settings::mode_name(*config.settings.mode)))
        << "\n";
  }
  out << "schema_version = " << config.settings.schema_version << "\n";

  for (const auto &[domain, site] : config.settings.sites) {
    out << "\n[sites." << common::quote_toml_string(domain) << "]\n";
    if (site.mode.has_value()) {
      out << "mode = " << common::quote_toml_string(std::string(settings::mode_name(*site.mode)))
          << "\n";
    }
    out << "main_world_off = " << bool_to_toml(site.main_world_off) << "\n";
    out << "cosmetics_off = " << bool_to_toml(site.cosmetics_off) << "\n";
    out << "site_fixes_off = " << bool_to_toml(site.site_fixes_off) << "\n";
    out << "breakage_count = " << site.breakage_count << "\n";
    if (site.relax_until_ms.has_value()) {
      out << "relax_until = " << *site.relax_until_ms << "\n";
    }
  }
  return out.str();
}

} // namespace domshield::config
