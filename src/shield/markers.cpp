#include "domshield/shield/markers.hpp"

#include "domshield/common/string_util.hpp"

#include <algorithm>

namespace domshield::shield {

const std::vector<std::string> &navigation_networks() {
  static const std::vector<std::string> networks = {
      "exoclick", "adsterra",  "juicyads",     "trafficjunky", "popunder",
      "clickunder", "propellerads", "hilltopads", "adcash",   "clickadu",
      "popcash",  "popads",    "admaven",      "revcontent",
  };
  return networks;
}

const std::vector<std::string> &frame_networks() {
  static const std::vector<std::string> networks = [] {
    std::vector<std::string> out = navigation_networks();
    out.insert(out.end(), {"mgid.com", "taboola", "outbrain"});
    return out;
  }();
  return networks;
}

const std::vector<std::string> &markup_markers() {
  static const std::vector<std::string> markers = {
      "data-element",
      "data-izone",
      "title=\"offer\"",
      "title=\"Advertisement\"",
  };
  return markers;
}

bool matches_network(std::string_view url, const std::vector<std::string> &networks) {
  if (url.empty()) {
    return false;
  }
  const std::string lower = common::to_lower(std::string(url));
  return std::any_of(networks.begin(), networks.end(), [&](const std::string &network) {
    return lower.find(network) != std::string::npos;
  });
}

bool is_marker_attribute(std::string_view name) {
  const std::string lower = common::to_lower(std::string(name));
  return lower == MARKER_ELEMENT_ATTR || lower == MARKER_ZONE_ATTR;
}

bool has_marker_attribute(const dom::Element &element) {
  return element.has_attribute(MARKER_ELEMENT_ATTR) || element.has_attribute(MARKER_ZONE_ATTR);
}

bool has_slot_class(const dom::Element &element) {
  return element.class_name().find(SLOT_CLASS_MARKER) != std::string::npos;
}

} // namespace domshield::shield
