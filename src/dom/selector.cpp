#include "domshield/dom/selector.hpp"

#include "domshield/common/string_util.hpp"
#include "domshield/dom/element.hpp"

#include <cctype>

namespace domshield::dom {

namespace {

bool is_space(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool is_identifier_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-' || ch == '_' ||
         static_cast<unsigned char>(ch) >= 0x80;
}

void skip_spaces(std::string_view source, std::size_t &cursor) {
  while (cursor < source.size() && is_space(source[cursor])) {
    ++cursor;
  }
}

std::string parse_identifier(std::string_view source, std::size_t &cursor) {
  const std::size_t start = cursor;
  while (cursor < source.size() && is_identifier_char(source[cursor])) {
    ++cursor;
  }
  return std::string(source.substr(start, cursor - start));
}

bool is_empty_compound(const CompoundSelector &compound) {
  return compound.tag.empty() && compound.ids.empty() && compound.classes.empty() &&
         compound.attributes.empty();
}

common::Result<AttributeSelector> parse_attribute(std::string_view source, std::size_t &cursor) {
  // cursor sits just past '['
  AttributeSelector attr;
  skip_spaces(source, cursor);
  attr.name = common::to_lower(parse_identifier(source, cursor));
  if (attr.name.empty()) {
    return common::Result<AttributeSelector>::failure("expected attribute name");
  }
  skip_spaces(source, cursor);
  if (cursor >= source.size()) {
    return common::Result<AttributeSelector>::failure("unterminated attribute selector");
  }
  if (source[cursor] == ']') {
    ++cursor;
    attr.op = AttributeOperator::Exists;
    return common::Result<AttributeSelector>::success(std::move(attr));
  }

  const char lead = source[cursor];
  if (lead == '=') {
    attr.op = AttributeOperator::Equals;
    ++cursor;
  } else if (cursor + 1 < source.size() && source[cursor + 1] == '=') {
    switch (lead) {
    case '~':
      attr.op = AttributeOperator::Includes;
      break;
    case '|':
      attr.op = AttributeOperator::DashMatch;
      break;
    case '^':
      attr.op = AttributeOperator::Prefix;
      break;
    case '$':
      attr.op = AttributeOperator::Suffix;
      break;
    case '*':
      attr.op = AttributeOperator::Substring;
      break;
    default:
      return common::Result<AttributeSelector>::failure(
          std::string("unknown attribute operator '") + lead + "='");
    }
    cursor += 2;
  } else {
    return common::Result<AttributeSelector>::failure("invalid attribute selector");
  }

  skip_spaces(source, cursor);
  if (cursor >= source.size()) {
    return common::Result<AttributeSelector>::failure("missing attribute value");
  }
  if (source[cursor] == '"' || source[cursor] == '\'') {
    const char quote = source[cursor++];
    const std::size_t end = source.find(quote, cursor);
    if (end == std::string_view::npos) {
      return common::Result<AttributeSelector>::failure("unterminated attribute value");
    }
    attr.value = std::string(source.substr(cursor, end - cursor));
    cursor = end + 1;
  } else {
    attr.value = parse_identifier(source, cursor);
    if (attr.value.empty()) {
      return common::Result<AttributeSelector>::failure("missing attribute value");
    }
  }
  skip_spaces(source, cursor);
  if (cursor >= source.size() || source[cursor] != ']') {
    return common::Result<AttributeSelector>::failure("expected ']'");
  }
  ++cursor;
  return common::Result<AttributeSelector>::success(std::move(attr));
}

common::Result<ComplexSelector> parse_complex(std::string_view source) {
  ComplexSelector complex;
  CompoundSelector current;
  std::size_t cursor = 0;
  bool pending_combinator = false;
  Combinator combinator = Combinator::Descendant;

  const auto finish_compound = [&]() -> bool {
    if (is_empty_compound(current)) {
      return false;
    }
    if (!complex.compounds.empty()) {
      complex.combinators.push_back(combinator);
    }
    complex.compounds.push_back(std::move(current));
    current = CompoundSelector{};
    combinator = Combinator::Descendant;
    pending_combinator = false;
    return true;
  };

  skip_spaces(source, cursor);
  while (cursor < source.size()) {
    const char ch = source[cursor];
    if (is_space(ch) || ch == '>') {
      if (!is_empty_compound(current) && !finish_compound()) {
        return common::Result<ComplexSelector>::failure("empty compound selector");
      }
      skip_spaces(source, cursor);
      if (cursor < source.size() && source[cursor] == '>') {
        if (complex.compounds.empty() || combinator == Combinator::Child) {
          return common::Result<ComplexSelector>::failure("dangling '>' combinator");
        }
        combinator = Combinator::Child;
        ++cursor;
        skip_spaces(source, cursor);
      }
      pending_combinator = true;
      continue;
    }

    if (ch == '#') {
      ++cursor;
      auto id = parse_identifier(source, cursor);
      if (id.empty()) {
        return common::Result<ComplexSelector>::failure("expected id after '#'");
      }
      current.ids.push_back(std::move(id));
    } else if (ch == '.') {
      ++cursor;
      auto cls = parse_identifier(source, cursor);
      if (cls.empty()) {
        return common::Result<ComplexSelector>::failure("expected class name after '.'");
      }
      current.classes.push_back(std::move(cls));
    } else if (ch == '[') {
      ++cursor;
      auto attr = parse_attribute(source, cursor);
      if (!attr.ok()) {
        return common::Result<ComplexSelector>::failure(attr.error());
      }
      current.attributes.push_back(std::move(attr.value()));
    } else if (ch == '*') {
      if (!is_empty_compound(current)) {
        return common::Result<ComplexSelector>::failure("unexpected '*'");
      }
      current.tag = "*";
      ++cursor;
    } else if (is_identifier_char(ch)) {
      if (!is_empty_compound(current)) {
        return common::Result<ComplexSelector>::failure("type selector must come first");
      }
      current.tag = common::to_lower(parse_identifier(source, cursor));
    } else {
      return common::Result<ComplexSelector>::failure(std::string("unsupported selector syntax '") +
                                                     ch + "'");
    }
  }

  if (is_empty_compound(current)) {
    if (pending_combinator && combinator == Combinator::Child) {
      return common::Result<ComplexSelector>::failure("dangling '>' combinator");
    }
    if (complex.compounds.empty()) {
      return common::Result<ComplexSelector>::failure("empty selector");
    }
  } else {
    (void)finish_compound();
  }
  return common::Result<ComplexSelector>::success(std::move(complex));
}

bool matches_attribute(const Element &element, const AttributeSelector &attr) {
  const auto value = element.get_attribute(attr.name);
  if (!value.has_value()) {
    return false;
  }
  const std::string &actual = *value;
  switch (attr.op) {
  case AttributeOperator::Exists:
    return true;
  case AttributeOperator::Equals:
    return actual == attr.value;
  case AttributeOperator::Includes:
    for (const auto &token : common::split_whitespace(actual)) {
      if (token == attr.value) {
        return true;
      }
    }
    return false;
  case AttributeOperator::DashMatch:
    return actual == attr.value || common::starts_with(actual, attr.value + "-");
  case AttributeOperator::Prefix:
    return !attr.value.empty() && common::starts_with(actual, attr.value);
  case AttributeOperator::Suffix:
    return !attr.value.empty() && common::ends_with(actual, attr.value);
  case AttributeOperator::Substring:
    return !attr.value.empty() && actual.find(attr.value) != std::string::npos;
  }
  return false;
}

bool matches_compound(const Element &element, const CompoundSelector &compound) {
  if (!compound.tag.empty() && compound.tag != "*" && compound.tag != element.tag_name()) {
    return false;
  }
  if (!compound.ids.empty()) {
    const std::string id = element.id();
    for (const auto &wanted : compound.ids) {
      if (id != wanted) {
        return false;
      }
    }
  }
  if (!compound.classes.empty()) {
    const auto classes = element.class_list();
    for (const auto &wanted : compound.classes) {
      bool found = false;
      for (const auto &cls : classes) {
        if (cls == wanted) {
          found = true;
          break;
        }
      }
      if (!found) {
        return false;
      }
    }
  }
  for (const auto &attr : compound.attributes) {
    if (!matches_attribute(element, attr)) {
      return false;
    }
  }
  return true;
}

// Right-to-left match of compounds[0..index] ending at `element`.
bool matches_from(const ComplexSelector &complex, std::size_t index, const Element &element) {
  if (!matches_compound(element, complex.compounds[index])) {
    return false;
  }
  if (index == 0) {
    return true;
  }
  const Combinator combinator = complex.combinators[index - 1];
  auto ancestor = element.parent();
  if (combinator == Combinator::Child) {
    return ancestor && matches_from(complex, index - 1, *ancestor);
  }
  while (ancestor) {
    if (matches_from(complex, index - 1, *ancestor)) {
      return true;
    }
    ancestor = ancestor->parent();
  }
  return false;
}

// Splits on top-level commas, ignoring commas inside brackets or quotes.
std::vector<std::string> split_selector_list(std::string_view text) {
  std::vector<std::string> parts;
  std::string current;
  char quote = '\0';
  int bracket_depth = 0;
  for (const char ch : text) {
    if (quote != '\0') {
      if (ch == quote) {
        quote = '\0';
      }
      current.push_back(ch);
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '[') {
      ++bracket_depth;
    } else if (ch == ']') {
      --bracket_depth;
    } else if (ch == ',' && bracket_depth == 0) {
      parts.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  parts.push_back(current);
  return parts;
}

} // namespace

common::Result<SelectorList> SelectorList::parse(std::string_view text) {
  SelectorList list;
  list.text_ = common::trim(std::string(text));
  for (const auto &part : split_selector_list(text)) {
    const std::string trimmed = common::trim(part);
    auto complex = parse_complex(trimmed);
    if (!complex.ok()) {
      return common::Result<SelectorList>::failure("invalid selector '" + trimmed +
                                                   "': " + complex.error());
    }
    list.selectors_.push_back(std::move(complex.value()));
  }
  return common::Result<SelectorList>::success(std::move(list));
}

bool SelectorList::matches(const Element &element) const {
  for (const auto &complex : selectors_) {
    if (matches_from(complex, complex.compounds.size() - 1, element)) {
      return true;
    }
  }
  return false;
}

} // namespace domshield::dom
