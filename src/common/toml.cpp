#include "domshield/common/toml.hpp"

#include "domshield/common/string_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace domshield::common {

namespace {

using ParseError = std::string;

void skip_ws(std::string_view text, std::size_t &pos) {
  while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
    ++pos;
  }
}

bool is_bare_key_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

// Parses a basic ("...") or literal ('...') string starting at pos.
bool parse_string(std::string_view text, std::size_t &pos, std::string &out, ParseError &error) {
  const char quote = text[pos];
  ++pos;
  out.clear();
  while (pos < text.size()) {
    const char ch = text[pos];
    if (ch == quote) {
      ++pos;
      return true;
    }
    if (quote == '"' && ch == '\\') {
      if (pos + 1 >= text.size()) {
        break;
      }
      const char esc = text[pos + 1];
      switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '"':
        out.push_back('"');
        break;
      case '\\':
        out.push_back('\\');
        break;
      default:
        error = std::string("unsupported escape \\") + esc;
        return false;
      }
      pos += 2;
      continue;
    }
    out.push_back(ch);
    ++pos;
  }
  error = "unterminated string";
  return false;
}

bool parse_key_path(std::string_view text, std::size_t &pos, std::vector<std::string> &segments,
                    ParseError &error) {
  segments.clear();
  while (true) {
    skip_ws(text, pos);
    if (pos >= text.size()) {
      error = "expected key";
      return false;
    }
    std::string segment;
    if (text[pos] == '"' || text[pos] == '\'') {
      if (!parse_string(text, pos, segment, error)) {
        return false;
      }
    } else {
      const std::size_t start = pos;
      while (pos < text.size() && is_bare_key_char(text[pos])) {
        ++pos;
      }
      if (pos == start) {
        error = "invalid key character";
        return false;
      }
      segment = std::string(text.substr(start, pos - start));
    }
    segments.push_back(std::move(segment));
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      continue;
    }
    return true;
  }
}

bool parse_scalar(std::string_view text, std::size_t &pos, TomlValue &value, ParseError &error) {
  skip_ws(text, pos);
  if (pos >= text.size()) {
    error = "missing value";
    return false;
  }
  if (text[pos] == '"' || text[pos] == '\'') {
    value.kind = TomlValue::Kind::String;
    return parse_string(text, pos, value.text, error);
  }

  const std::size_t start = pos;
  while (pos < text.size() && text[pos] != ',' && text[pos] != ']' && text[pos] != '#' &&
         std::isspace(static_cast<unsigned char>(text[pos])) == 0) {
    ++pos;
  }
  const std::string token(text.substr(start, pos - start));
  if (token == "true" || token == "false") {
    value.kind = TomlValue::Kind::Bool;
    value.text = token;
    return true;
  }

  std::string digits;
  for (const char ch : token) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  if (digits.empty()) {
    error = "missing value";
    return false;
  }

  std::int64_t integer = 0;
  const auto int_result = std::from_chars(digits.data(), digits.data() + digits.size(), integer);
  if (int_result.ec == std::errc() && int_result.ptr == digits.data() + digits.size()) {
    value.kind = TomlValue::Kind::Integer;
    value.text = digits;
    return true;
  }

  char *end = nullptr;
  (void)std::strtod(digits.c_str(), &end);
  if (end != nullptr && *end == '\0') {
    value.kind = TomlValue::Kind::Float;
    value.text = digits;
    return true;
  }

  error = "invalid value: " + token;
  return false;
}

bool parse_value(std::string_view text, std::size_t &pos, TomlValue &value, ParseError &error) {
  skip_ws(text, pos);
  if (pos < text.size() && text[pos] == '[') {
    ++pos;
    value.kind = TomlValue::Kind::Array;
    value.items.clear();
    while (true) {
      while (pos < text.size() &&
             (std::isspace(static_cast<unsigned char>(text[pos])) != 0 || text[pos] == ',')) {
        ++pos;
      }
      if (pos >= text.size()) {
        error = "unterminated array";
        return false;
      }
      if (text[pos] == ']') {
        ++pos;
        return true;
      }
      TomlValue item;
      if (!parse_scalar(text, pos, item, error)) {
        return false;
      }
      value.items.push_back(std::move(item.text));
    }
  }
  return parse_scalar(text, pos, value, error);
}

// Multi-line arrays are folded into one logical line before parsing.
std::vector<std::pair<std::size_t, std::string>> logical_lines(std::string_view text) {
  std::vector<std::pair<std::size_t, std::string>> out;
  std::size_t line_no = 0;
  std::string pending;
  std::size_t pending_line = 0;
  int depth = 0;

  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t end = text.find('\n', pos);
    std::string line(text.substr(pos, end == std::string_view::npos ? std::string_view::npos
                                                                     : end - pos));
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    bool in_string = false;
    char quote = '\0';
    std::size_t cut = line.size();
    for (std::size_t i = 0; i < line.size(); ++i) {
      const char ch = line[i];
      if (in_string) {
        if (ch == '\\' && quote == '"') {
          ++i;
        } else if (ch == quote) {
          in_string = false;
        }
        continue;
      }
      if (ch == '"' || ch == '\'') {
        in_string = true;
        quote = ch;
      } else if (ch == '#') {
        cut = i;
        break;
      } else if (ch == '[' && (depth > 0 || line.find('=') < i)) {
        ++depth;
      } else if (ch == ']' && depth > 0) {
        --depth;
      }
    }
    line.resize(cut);

    if (pending.empty()) {
      pending_line = line_no;
    }
    pending += line;
    if (depth == 0) {
      out.emplace_back(pending_line, std::move(pending));
      pending.clear();
    } else {
      pending.push_back(' ');
    }

    if (end == std::string_view::npos) {
      break;
    }
    pos = end + 1;
  }
  if (!pending.empty()) {
    out.emplace_back(pending_line, std::move(pending));
  }
  return out;
}

} // namespace

Result<TomlDocument> parse_toml(std::string_view text) {
  TomlDocument doc;
  std::string table_prefix;

  for (const auto &[line_no, raw] : logical_lines(text)) {
    const std::string line = trim(raw);
    if (line.empty()) {
      continue;
    }
    const std::string where = "line " + std::to_string(line_no) + ": ";
    ParseError error;
    std::vector<std::string> segments;

    if (line.front() == '[') {
      if (line.size() < 2 || line.back() != ']' || line[1] == '[') {
        return Result<TomlDocument>::failure(where + "invalid table header");
      }
      std::size_t pos = 1;
      const std::string_view header(line.data(), line.size() - 1);
      if (!parse_key_path(header, pos, segments, error)) {
        return Result<TomlDocument>::failure(where + error);
      }
      skip_ws(header, pos);
      if (pos != header.size()) {
        return Result<TomlDocument>::failure(where + "trailing characters in table header");
      }
      table_prefix = join(segments, ".") + ".";
      continue;
    }

    std::size_t pos = 0;
    if (!parse_key_path(line, pos, segments, error)) {
      return Result<TomlDocument>::failure(where + error);
    }
    if (pos >= line.size() || line[pos] != '=') {
      return Result<TomlDocument>::failure(where + "expected '='");
    }
    ++pos;

    TomlValue value;
    if (!parse_value(line, pos, value, error)) {
      return Result<TomlDocument>::failure(where + error);
    }
    skip_ws(line, pos);
    if (pos != line.size()) {
      return Result<TomlDocument>::failure(where + "trailing characters after value");
    }
    doc.values[table_prefix + join(segments, ".")] = std::move(value);
  }

  return Result<TomlDocument>::success(std::move(doc));
}

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind == TomlValue::Kind::Array) {
    return fallback;
  }
  return it->second.text;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::Bool) {
    return fallback;
  }
  return it->second.text == "true";
}

std::int64_t TomlDocument::get_int(const std::string &key, const std::int64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::Integer) {
    return fallback;
  }
  std::int64_t out = fallback;
  const auto &text = it->second.text;
  const auto parsed = std::from_chars(text.data(), text.data() + text.size(), out);
  return parsed.ec == std::errc() ? out : fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const std::int64_t value = get_int(key, -1);
  return value < 0 ? fallback : static_cast<std::uint64_t>(value);
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || (it->second.kind != TomlValue::Kind::Float &&
                             it->second.kind != TomlValue::Kind::Integer)) {
    return fallback;
  }
  return std::strtod(it->second.text.c_str(), nullptr);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::Array) {
    return fallback;
  }
  return it->second.items;
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  out.push_back('"');
  return out;
}

} // namespace domshield::common
