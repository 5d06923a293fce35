#pragma once

#include "domshield/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace domshield::dom {

class Element;

enum class AttributeOperator {
  Exists,
  Equals,
  Includes,  // ~=
  DashMatch, // |=
  Prefix,    // ^=
  Suffix,    // $=
  Substring, // *=
};

struct AttributeSelector {
  std::string name;
  std::string value;
  AttributeOperator op = AttributeOperator::Exists;
};

struct CompoundSelector {
  std::string tag; // empty or "*" matches any element
  std::vector<std::string> ids;
  std::vector<std::string> classes;
  std::vector<AttributeSelector> attributes;
};

enum class Combinator { Descendant, Child };

struct ComplexSelector {
  std::vector<CompoundSelector> compounds;
  std::vector<Combinator> combinators; // combinators[i] joins compounds[i] and compounds[i + 1]
};

/// A comma-separated selector list. Supports type, universal, id, class and attribute
/// selectors joined by descendant or child combinators.
class SelectorList {
public:
  SelectorList() = default;

  [[nodiscard]] static common::Result<SelectorList> parse(std::string_view text);

  [[nodiscard]] bool matches(const Element &element) const;
  [[nodiscard]] bool empty() const { return selectors_.empty(); }
  [[nodiscard]] const std::string &text() const { return text_; }

private:
  std::string text_;
  std::vector<ComplexSelector> selectors_;
};

} // namespace domshield::dom
