#include "domshield/shield/capability_interceptor.hpp"

#include "domshield/common/string_util.hpp"
#include "domshield/observability/global.hpp"
#include "domshield/shield/markers.hpp"
#include "domshield/shield/suppressor.hpp"

#include <algorithm>
#include <exception>

namespace domshield::shield {

namespace {

bool is_always_allowed_target(const std::string &url) {
  return url.empty() || url == "about:blank" || common::starts_with(url, "blob:") ||
         common::starts_with(url, "data:");
}

void log_fail_open(const char *operation, const std::exception &error) {
  observability::record_debug("interceptor",
                              std::string(operation) + " check failed, allowing: " + error.what());
}

} // namespace

CapabilityInterceptor::CapabilityInterceptor(std::shared_ptr<dom::HostCapabilities> delegate)
    : delegate_(delegate ? std::move(delegate) : std::make_shared<dom::NativeCapabilities>()) {}

bool CapabilityInterceptor::should_block_navigation(const std::string &url) {
  if (is_always_allowed_target(url)) {
    return false;
  }
  if (matches_network(url, navigation_networks())) {
    return true;
  }
  const std::string lower = common::to_lower(url);
  return lower.find("popunder") != std::string::npos ||
         lower.find("clickunder") != std::string::npos;
}

bool CapabilityInterceptor::should_block_markup(const std::string &markup) {
  if (markup.size() <= MARKUP_BLOCK_MIN_LENGTH) {
    return false;
  }
  const auto &markers = markup_markers();
  return std::any_of(markers.begin(), markers.end(), [&](const std::string &marker) {
    return markup.find(marker) != std::string::npos;
  });
}

bool CapabilityInterceptor::is_marked_element(const dom::Element &element) {
  return has_marker_attribute(element) || has_slot_class(element);
}

std::optional<dom::BrowsingContext> CapabilityInterceptor::open_context(const std::string &url,
                                                                        const std::string &target) {
  try {
    if (should_block_navigation(url)) {
      ++stats_.blocked_navigations;
      observability::record_debug("interceptor", "blocked navigation to " + url);
      return std::nullopt;
    }
  } catch (const std::exception &error) {
    log_fail_open("open_context", error);
  }
  return delegate_->open_context(url, target);
}

dom::ElementPtr CapabilityInterceptor::append_child(const dom::ElementPtr &parent,
                                                    const dom::ElementPtr &child) {
  try {
    if (child && is_marked_element(*child)) {
      Suppressor::suppress_style(*child);
      ++stats_.suppressed_elements;
    }
  } catch (const std::exception &error) {
    log_fail_open("append_child", error);
  }
  return delegate_->append_child(parent, child);
}

void CapabilityInterceptor::set_attribute(const dom::ElementPtr &element, const std::string &name,
                                          const std::string &value) {
  try {
    if (element && is_marker_attribute(name)) {
      Suppressor::suppress_style(*element);
      ++stats_.suppressed_elements;
    }
  } catch (const std::exception &error) {
    log_fail_open("set_attribute", error);
  }
  delegate_->set_attribute(element, name, value);
}

void CapabilityInterceptor::insert_markup(const dom::ElementPtr &element,
                                          const dom::InsertPosition position,
                                          const std::string &markup) {
  try {
    if (should_block_markup(markup)) {
      ++stats_.blocked_markup;
      observability::record_debug("interceptor", "blocked markup insertion of " +
                                                     std::to_string(markup.size()) + " bytes");
      return;
    }
  } catch (const std::exception &error) {
    log_fail_open("insert_markup", error);
  }
  delegate_->insert_markup(element, position, markup);
}

const char *install_outcome_name(const InstallOutcome outcome) {
  switch (outcome) {
  case InstallOutcome::Installed:
    return "installed";
  case InstallOutcome::AlreadyInstalled:
    return "already-installed";
  case InstallOutcome::SkippedNestedFrame:
    return "skipped-nested-frame";
  case InstallOutcome::SkippedBySettings:
    return "skipped-by-settings";
  }
  return "unknown";
}

InstallOutcome install_capability_interceptor(runtime::Page &page,
                                              const settings::ResolvedSite &site,
                                              const config::EngineConfig &engine) {
  if (site.site.main_world_off || site.mode == settings::FilteringMode::Lite || site.relaxed) {
    return InstallOutcome::SkippedBySettings;
  }
  if (!page.document().is_top_level() && !engine.allow_nested_frames) {
    return InstallOutcome::SkippedNestedFrame;
  }
  if (!page.claim_init_token(CAPABILITY_INIT_TOKEN)) {
    return InstallOutcome::AlreadyInstalled;
  }
  auto &document = page.document();
  document.set_capabilities(std::make_shared<CapabilityInterceptor>(document.capabilities()));
  observability::record_event("interceptor", "capability interceptor installed for " + site.domain);
  return InstallOutcome::Installed;
}

} // namespace domshield::shield
