#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domshield::dom {

enum class Position { Static, Relative, Absolute, Fixed, Sticky };

[[nodiscard]] std::string_view position_name(Position position);
[[nodiscard]] Position parse_position(std::string_view value);

/// Integer prefix of a z-index value, or nullopt for "auto" and other non-numbers.
[[nodiscard]] std::optional<int> parse_z_index(std::string_view value);

struct StyleDeclaration {
  std::string name;
  std::string value;
  bool important = false;
};

/// Declarations of a `style` attribute, in source order.
class InlineStyle {
public:
  [[nodiscard]] static InlineStyle parse(std::string_view css_text);

  [[nodiscard]] const StyleDeclaration *find(std::string_view name) const;
  void set(const std::string &name, const std::string &value, bool important);
  [[nodiscard]] std::string serialize() const;
  [[nodiscard]] bool empty() const { return declarations_.empty(); }

private:
  std::vector<StyleDeclaration> declarations_;
};

struct ComputedStyle {
  Position position = Position::Static;
  std::string z_index = "auto";
  std::string display = "block";
  std::string visibility = "visible";
  std::string pointer_events = "auto";

  [[nodiscard]] bool is_out_of_flow() const {
    return position == Position::Fixed || position == Position::Absolute;
  }
  [[nodiscard]] std::optional<int> z_index_value() const { return parse_z_index(z_index); }
};

} // namespace domshield::dom
