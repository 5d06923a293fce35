#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace domshield::common {

[[nodiscard]] std::string trim(std::string value);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] bool ends_with(std::string_view value, std::string_view suffix);

/// Split on runs of ASCII whitespace, dropping empty tokens.
[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view value);

[[nodiscard]] std::string join(const std::vector<std::string> &values, std::string_view separator);

/// Expand a leading "~/" to $HOME.
[[nodiscard]] std::string expand_path(const std::string &path);
[[nodiscard]] std::string home_dir();

} // namespace domshield::common
