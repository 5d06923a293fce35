#pragma once

#include "domshield/common/result.hpp"
#include "domshield/common/toml.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domshield::settings {

constexpr std::int64_t CURRENT_SCHEMA_VERSION = 2;
constexpr std::int64_t MAX_RELAX_MINUTES = 120;
constexpr std::uint32_t BREAKAGE_DOWNGRADE_THRESHOLD = 2;
constexpr std::size_t MAX_DOMAIN_LENGTH = 253;

enum class FilteringMode { Lite, Standard, Advanced };

[[nodiscard]] std::string_view mode_name(FilteringMode mode);
[[nodiscard]] std::optional<FilteringMode> parse_mode(std::string_view value);

struct SiteSettings {
  std::optional<FilteringMode> mode;
  bool main_world_off = false;
  bool cosmetics_off = false;
  bool site_fixes_off = false;
  std::uint32_t breakage_count = 0;
  /// Epoch milliseconds.
  std::optional<std::int64_t> relax_until_ms;
};

/// Read-only view of the persisted settings store.
struct SettingsSnapshot {
  std::int64_t schema_version = CURRENT_SCHEMA_VERSION;
  std::optional<FilteringMode> mode;
  std::map<std::string, SiteSettings> sites;
};

/// Settings for one site after defaults, downgrade and clamping are applied.
struct ResolvedSite {
  std::string domain;
  FilteringMode mode = FilteringMode::Lite;
  SiteSettings site;
  bool relaxed = false;
  bool downgraded = false;
};

/// Lowercase host of a URL or bare domain. Fails on empty hosts, hosts longer than 253
/// characters and hosts containing spaces.
[[nodiscard]] common::Result<std::string> normalize_domain(std::string_view input);

[[nodiscard]] common::Result<ResolvedSite> resolve_site(const SettingsSnapshot &snapshot,
                                                        std::string_view domain,
                                                        std::int64_t now_epoch_ms);

/// Relax deadlines further than MAX_RELAX_MINUTES from now are pulled back to that bound.
[[nodiscard]] std::optional<std::int64_t>
clamp_relax_until(std::optional<std::int64_t> relax_until_ms, std::int64_t now_epoch_ms);

/// Reads the `[settings]` and `[sites."<domain>"]` tables. Older schema versions are
/// migrated forward; every migration step and every ignored value adds a warning.
[[nodiscard]] SettingsSnapshot load_snapshot(const common::TomlDocument &doc,
                                             std::vector<std::string> &warnings);

} // namespace domshield::settings
