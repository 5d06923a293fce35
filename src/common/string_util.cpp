#include "domshield/common/string_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace domshield::common {

std::string trim(std::string value) {
  const auto not_space = [](unsigned char ch) { return std::isspace(ch) == 0; };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return value;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.substr(value.size() - suffix.size()) == suffix;
}

std::vector<std::string> split_whitespace(std::string_view value) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < value.size()) {
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])) != 0) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])) == 0) {
      ++pos;
    }
    if (pos > start) {
      out.emplace_back(value.substr(start, pos - start));
    }
  }
  return out;
}

std::string join(const std::vector<std::string> &values, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += values[i];
  }
  return out;
}

std::string home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return home;
  }
  return ".";
}

std::string expand_path(const std::string &path) {
  if (path == "~") {
    return home_dir();
  }
  if (starts_with(path, "~/")) {
    return home_dir() + path.substr(1);
  }
  return path;
}

} // namespace domshield::common
