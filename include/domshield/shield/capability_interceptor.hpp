#pragma once

#include "domshield/config/config.hpp"
#include "domshield/dom/capabilities.hpp"
#include "domshield/runtime/page.hpp"
#include "domshield/settings/site_settings.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace domshield::shield {

inline constexpr const char *CAPABILITY_INIT_TOKEN = "domshield.capability-interceptor";

struct InterceptorStats {
  std::size_t blocked_navigations = 0;
  std::size_t blocked_markup = 0;
  std::size_t suppressed_elements = 0;
};

/// Wraps a document's capability table and pre-empts known ad injection patterns. Every
/// call that is not blocked goes to the wrapped table unchanged.
class CapabilityInterceptor final : public dom::HostCapabilities {
public:
  explicit CapabilityInterceptor(std::shared_ptr<dom::HostCapabilities> delegate);

  std::optional<dom::BrowsingContext> open_context(const std::string &url,
                                                   const std::string &target) override;
  dom::ElementPtr append_child(const dom::ElementPtr &parent,
                               const dom::ElementPtr &child) override;
  void set_attribute(const dom::ElementPtr &element, const std::string &name,
                     const std::string &value) override;
  void insert_markup(const dom::ElementPtr &element, dom::InsertPosition position,
                     const std::string &markup) override;

  [[nodiscard]] static bool should_block_navigation(const std::string &url);
  [[nodiscard]] static bool should_block_markup(const std::string &markup);
  [[nodiscard]] static bool is_marked_element(const dom::Element &element);

  [[nodiscard]] const std::shared_ptr<dom::HostCapabilities> &delegate() const {
    return delegate_;
  }
  [[nodiscard]] const InterceptorStats &stats() const { return stats_; }

private:
  std::shared_ptr<dom::HostCapabilities> delegate_;
  InterceptorStats stats_;
};

enum class InstallOutcome { Installed, AlreadyInstalled, SkippedNestedFrame, SkippedBySettings };

[[nodiscard]] const char *install_outcome_name(InstallOutcome outcome);

/// Installs the interceptor on the page's document once per execution context. Skipped in
/// nested frames unless `engine.allow_nested_frames`, and for lite, relaxed or
/// main-world-off sites.
InstallOutcome install_capability_interceptor(runtime::Page &page,
                                              const settings::ResolvedSite &site,
                                              const config::EngineConfig &engine = {});

} // namespace domshield::shield
