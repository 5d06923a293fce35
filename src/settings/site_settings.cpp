#include "domshield/settings/site_settings.hpp"

#include "domshield/common/string_util.hpp"

#include <algorithm>
#include <limits>
#include <set>

namespace domshield::settings {

namespace {

constexpr const char *SITES_PREFIX = "sites.";
constexpr std::int64_t MINUTE_MS = 60'000;

const std::set<std::string> &site_fields() {
  static const std::set<std::string> fields = {"mode",           "main_world_off",
                                               "cosmetics_off",  "site_fixes_off",
                                               "breakage_count", "relax_until"};
  return fields;
}

std::optional<FilteringMode> read_mode(const common::TomlDocument &doc, const std::string &key,
                                       std::vector<std::string> &warnings) {
  if (!doc.has(key)) {
    return std::nullopt;
  }
  const std::string raw = doc.get_string(key, "");
  const auto mode = parse_mode(raw);
  if (!mode.has_value()) {
    warnings.push_back(key + ": unknown mode '" + raw + "' ignored");
  }
  return mode;
}

} // namespace

std::string_view mode_name(const FilteringMode mode) {
  switch (mode) {
  case FilteringMode::Lite:
    return "lite";
  case FilteringMode::Standard:
    return "standard";
  case FilteringMode::Advanced:
    return "advanced";
  }
  return "lite";
}

std::optional<FilteringMode> parse_mode(std::string_view value) {
  const std::string lower = common::to_lower(common::trim(std::string(value)));
  if (lower == "lite") {
    return FilteringMode::Lite;
  }
  if (lower == "standard") {
    return FilteringMode::Standard;
  }
  if (lower == "advanced") {
    return FilteringMode::Advanced;
  }
  return std::nullopt;
}

common::Result<std::string> normalize_domain(std::string_view input) {
  std::string host = common::trim(std::string(input));
  if (const auto scheme = host.find("://"); scheme != std::string::npos) {
    host = host.substr(scheme + 3);
  }
  const auto path = host.find_first_of("/?#");
  if (path != std::string::npos) {
    host = host.substr(0, path);
  }
  if (const auto at = host.rfind('@'); at != std::string::npos) {
    host = host.substr(at + 1);
  }
  if (!host.empty() && host.front() == '[') {
    const auto close = host.find(']');
    host = close == std::string::npos ? std::string() : host.substr(0, close + 1);
  } else if (const auto colon = host.find(':'); colon != std::string::npos) {
    host = host.substr(0, colon);
  }
  host = common::to_lower(host);

  if (host.empty()) {
    return common::Result<std::string>::failure("invalid domain: empty host");
  }
  if (host.size() > MAX_DOMAIN_LENGTH) {
    return common::Result<std::string>::failure("invalid domain: longer than 253 characters");
  }
  if (host.find(' ') != std::string::npos) {
    return common::Result<std::string>::failure("invalid domain: contains spaces");
  }
  return common::Result<std::string>::success(std::move(host));
}

std::optional<std::int64_t> clamp_relax_until(const std::optional<std::int64_t> relax_until_ms,
                                              const std::int64_t now_epoch_ms) {
  if (!relax_until_ms.has_value()) {
    return std::nullopt;
  }
  return std::min(*relax_until_ms, now_epoch_ms + MAX_RELAX_MINUTES * MINUTE_MS);
}

common::Result<ResolvedSite> resolve_site(const SettingsSnapshot &snapshot,
                                          std::string_view domain,
                                          const std::int64_t now_epoch_ms) {
  auto normalized = normalize_domain(domain);
  if (!normalized.ok()) {
    return common::Result<ResolvedSite>::failure(normalized.error());
  }

  ResolvedSite out;
  out.domain = normalized.value();
  if (const auto it = snapshot.sites.find(out.domain); it != snapshot.sites.end()) {
    out.site = it->second;
  }

  out.mode = out.site.mode.value_or(snapshot.mode.value_or(FilteringMode::Lite));
  if (out.site.breakage_count >= BREAKAGE_DOWNGRADE_THRESHOLD && out.mode != FilteringMode::Lite) {
    out.mode = FilteringMode::Lite;
    out.downgraded = true;
  }

  out.site.relax_until_ms = clamp_relax_until(out.site.relax_until_ms, now_epoch_ms);
  out.relaxed = out.site.relax_until_ms.has_value() && now_epoch_ms < *out.site.relax_until_ms;
  return common::Result<ResolvedSite>::success(std::move(out));
}

SettingsSnapshot load_snapshot(const common::TomlDocument &doc,
                               std::vector<std::string> &warnings) {
  SettingsSnapshot snapshot;
  snapshot.mode = read_mode(doc, "settings.mode", warnings);

  const bool has_store = std::any_of(doc.values.begin(), doc.values.end(), [](const auto &entry) {
    return common::starts_with(entry.first, "settings.") ||
           common::starts_with(entry.first, SITES_PREFIX);
  });
  const std::int64_t stored_version =
      has_store ? doc.get_int("settings.schema_version", 0) : CURRENT_SCHEMA_VERSION;
  if (stored_version > CURRENT_SCHEMA_VERSION) {
    warnings.push_back("settings.schema_version " + std::to_string(stored_version) +
                       " is newer than supported version " +
                       std::to_string(CURRENT_SCHEMA_VERSION));
  }

  // Group `sites.<domain>.<field>` keys by domain. Domains contain dots, fields do not.
  std::map<std::string, std::vector<std::string>> site_keys;
  for (const auto &[key, value] : doc.values) {
    if (!common::starts_with(key, SITES_PREFIX)) {
      continue;
    }
    const auto dot = key.rfind('.');
    if (dot == std::string::npos || dot < std::string(SITES_PREFIX).size()) {
      warnings.push_back(key + ": expected sites.\"<domain>\".<field>");
      continue;
    }
    const std::string field = key.substr(dot + 1);
    const std::string domain = key.substr(std::string(SITES_PREFIX).size(),
                                          dot - std::string(SITES_PREFIX).size());
    if (!site_fields().contains(field)) {
      warnings.push_back(key + ": unknown site field ignored");
      continue;
    }
    site_keys[domain].push_back(field);
  }

  for (const auto &[raw_domain, fields] : site_keys) {
    auto domain = normalize_domain(raw_domain);
    if (!domain.ok()) {
      warnings.push_back("sites." + raw_domain + ": " + domain.error());
      continue;
    }
    const std::string prefix = std::string(SITES_PREFIX) + raw_domain + ".";
    SiteSettings site;
    site.mode = read_mode(doc, prefix + "mode", warnings);
    site.main_world_off = doc.get_bool(prefix + "main_world_off", false);
    site.cosmetics_off = doc.get_bool(prefix + "cosmetics_off", false);
    site.site_fixes_off = doc.get_bool(prefix + "site_fixes_off", false);
    site.breakage_count =
        static_cast<std::uint32_t>(std::min<std::uint64_t>(
            doc.get_u64(prefix + "breakage_count", 0), std::numeric_limits<std::uint32_t>::max()));
    if (doc.has(prefix + "relax_until")) {
      const std::int64_t until = doc.get_int(prefix + "relax_until", -1);
      if (until > 0) {
        site.relax_until_ms = until;
      } else {
        warnings.push_back(prefix + "relax_until: expected epoch milliseconds");
      }
    }

    if (stored_version < CURRENT_SCHEMA_VERSION) {
      static const char *const added_in_v2[] = {"main_world_off", "cosmetics_off",
                                                "site_fixes_off", "breakage_count"};
      for (const char *name : added_in_v2) {
        if (std::find(fields.begin(), fields.end(), name) == fields.end()) {
          warnings.push_back(prefix + name + ": missing, defaulted during migration");
        }
      }
    }
    snapshot.sites[domain.value()] = site;
  }

  if (stored_version < CURRENT_SCHEMA_VERSION) {
    warnings.push_back(
        (stored_version == 0 ? std::string("settings.schema_version missing")
                             : "settings.schema_version " + std::to_string(stored_version)) +
        ": migrated to version " + std::to_string(CURRENT_SCHEMA_VERSION));
  }
  snapshot.schema_version = CURRENT_SCHEMA_VERSION;
  return snapshot;
}

} // namespace domshield::settings
