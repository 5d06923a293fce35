#pragma once

#include <stdexcept>
#include <string>

namespace domshield::dom {

class DomError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Thrown by style and layout reads on an element that is not attached to its document.
class DetachedNodeError : public DomError {
public:
  explicit DetachedNodeError(const std::string &what) : DomError(what) {}
};

/// Thrown when an insertion would create a cycle or cross documents.
class HierarchyError : public DomError {
public:
  explicit HierarchyError(const std::string &what) : DomError(what) {}
};

} // namespace domshield::dom
