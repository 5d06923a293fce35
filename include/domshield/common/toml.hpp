#pragma once

#include "domshield/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace domshield::common {

struct TomlValue {
  enum class Kind { String, Bool, Integer, Float, Array };

  Kind kind = Kind::String;
  std::string text;
  std::vector<std::string> items;
};

/// Flat view of a TOML document. Table headers and dotted keys are joined with '.'
/// so `[sites."a.com"] mode = "x"` is stored under `sites.a.com.mode`.
struct TomlDocument {
  std::map<std::string, TomlValue> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback = false) const;
  [[nodiscard]] std::int64_t get_int(const std::string &key, std::int64_t fallback = 0) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback = 0) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback = 0.0) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(std::string_view text);

[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace domshield::common
