#pragma once

#include "domshield/dom/element.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace domshield::shield {

inline constexpr std::string_view MARKER_ELEMENT_ATTR = "data-element";
inline constexpr std::string_view MARKER_ZONE_ATTR = "data-izone";
inline constexpr std::string_view SLOT_CLASS_MARKER = "AdSlot";
inline constexpr std::string_view GUARDED_ATTR = "data-domshield-guarded";
inline constexpr std::string_view SUPPRESSION_STYLE_ID = "domshield-suppression";

/// Fragments shorter than this are never treated as injected ad markup.
inline constexpr std::size_t MARKUP_BLOCK_MIN_LENGTH = 200;

/// Ad-network substrings checked against navigation targets.
[[nodiscard]] const std::vector<std::string> &navigation_networks();
/// Ad-network substrings checked against iframe sources; a superset of navigation_networks().
[[nodiscard]] const std::vector<std::string> &frame_networks();
[[nodiscard]] const std::vector<std::string> &markup_markers();

/// Case-insensitive substring match against `networks`.
[[nodiscard]] bool matches_network(std::string_view url, const std::vector<std::string> &networks);

[[nodiscard]] bool is_marker_attribute(std::string_view name);
[[nodiscard]] bool has_marker_attribute(const dom::Element &element);
[[nodiscard]] bool has_slot_class(const dom::Element &element);

} // namespace domshield::shield
