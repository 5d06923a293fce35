#pragma once

#include "domshield/dom/element.hpp"

#include <optional>
#include <string>
#include <vector>

namespace domshield::dom {

enum class InsertPosition { BeforeBegin, AfterBegin, BeforeEnd, AfterEnd };

struct BrowsingContext {
  std::string url;
  std::string target;
};

/// The operations page scripts use to create contexts and change the tree. A document holds
/// one table; wrappers replace it and keep the previous table as their delegate.
class HostCapabilities {
public:
  virtual ~HostCapabilities() = default;

  /// Returns nullopt when no context was opened.
  virtual std::optional<BrowsingContext> open_context(const std::string &url,
                                                      const std::string &target) = 0;
  virtual ElementPtr append_child(const ElementPtr &parent, const ElementPtr &child) = 0;
  virtual void set_attribute(const ElementPtr &element, const std::string &name,
                             const std::string &value) = 0;
  virtual void insert_markup(const ElementPtr &element, InsertPosition position,
                             const std::string &markup) = 0;
};

/// Default table: performs every operation directly on the tree.
class NativeCapabilities final : public HostCapabilities {
public:
  std::optional<BrowsingContext> open_context(const std::string &url,
                                              const std::string &target) override;
  ElementPtr append_child(const ElementPtr &parent, const ElementPtr &child) override;
  void set_attribute(const ElementPtr &element, const std::string &name,
                     const std::string &value) override;
  /// Markup is not parsed; it lands as the text of a `template` element at `position`.
  void insert_markup(const ElementPtr &element, InsertPosition position,
                     const std::string &markup) override;

  [[nodiscard]] const std::vector<BrowsingContext> &opened_contexts() const { return opened_; }

private:
  std::vector<BrowsingContext> opened_;
};

} // namespace domshield::dom
