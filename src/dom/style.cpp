#include "domshield/dom/style.hpp"

#include "domshield/common/string_util.hpp"

#include <cctype>

namespace domshield::dom {

std::string_view position_name(const Position position) {
  switch (position) {
  case Position::Static:
    return "static";
  case Position::Relative:
    return "relative";
  case Position::Absolute:
    return "absolute";
  case Position::Fixed:
    return "fixed";
  case Position::Sticky:
    return "sticky";
  }
  return "static";
}

Position parse_position(std::string_view value) {
  const std::string lower = common::to_lower(common::trim(std::string(value)));
  if (lower == "fixed") {
    return Position::Fixed;
  }
  if (lower == "absolute") {
    return Position::Absolute;
  }
  if (lower == "relative") {
    return Position::Relative;
  }
  if (lower == "sticky") {
    return Position::Sticky;
  }
  return Position::Static;
}

std::optional<int> parse_z_index(std::string_view value) {
  std::size_t pos = 0;
  while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])) != 0) {
    ++pos;
  }
  bool negative = false;
  if (pos < value.size() && (value[pos] == '-' || value[pos] == '+')) {
    negative = value[pos] == '-';
    ++pos;
  }
  const std::size_t digits_start = pos;
  long long out = 0;
  while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])) != 0) {
    if (out < 100000000000LL) {
      out = out * 10 + (value[pos] - '0');
    }
    ++pos;
  }
  if (pos == digits_start) {
    return std::nullopt;
  }
  if (out > 2147483647LL) {
    out = 2147483647LL;
  }
  return static_cast<int>(negative ? -out : out);
}

InlineStyle InlineStyle::parse(std::string_view css_text) {
  InlineStyle style;
  std::size_t start = 0;
  while (start <= css_text.size()) {
    const std::size_t end = css_text.find(';', start);
    const std::string_view chunk =
        css_text.substr(start, end == std::string_view::npos ? std::string_view::npos
                                                             : end - start);
    const std::size_t colon = chunk.find(':');
    if (colon != std::string_view::npos) {
      std::string name = common::to_lower(common::trim(std::string(chunk.substr(0, colon))));
      std::string value = common::trim(std::string(chunk.substr(colon + 1)));
      bool important = false;
      const std::size_t bang = value.find('!');
      if (bang != std::string::npos &&
          common::to_lower(common::trim(value.substr(bang + 1))) == "important") {
        important = true;
        value = common::trim(value.substr(0, bang));
      }
      if (!name.empty()) {
        style.set(name, value, important);
      }
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return style;
}

const StyleDeclaration *InlineStyle::find(std::string_view name) const {
  for (const auto &decl : declarations_) {
    if (decl.name == name) {
      return &decl;
    }
  }
  return nullptr;
}

void InlineStyle::set(const std::string &name, const std::string &value, const bool important) {
  for (auto &decl : declarations_) {
    if (decl.name == name) {
      decl.value = value;
      decl.important = important;
      return;
    }
  }
  declarations_.push_back({name, value, important});
}

std::string InlineStyle::serialize() const {
  std::string out;
  for (const auto &decl : declarations_) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += decl.name + ": " + decl.value;
    if (decl.important) {
      out += " !important";
    }
    out.push_back(';');
  }
  return out;
}

} // namespace domshield::dom
