#pragma once

#include "rmount/common/result.hpp"

#include <string>

namespace rmount::resource {

struct ResourceStatus {
  bool healthy = false;
  std::string state;
  std::string detail;
};

/// An external long-running process tied to a releasable OS resource.
class ManagedResource {
public:
  virtual ~ManagedResource() = default;

  [[nodiscard]] virtual std::string name() const = 0;
  /// Blocks until the resource is usable or has definitely failed.
  [[nodiscard]] virtual common::Status start() = 0;
  /// Non-blocking where the implementation allows it.
  [[nodiscard]] virtual ResourceStatus probe() = 0;
  /// Idempotent; releases the resource on every path.
  [[nodiscard]] virtual common::Status stop() = 0;
};

} // namespace rmount::resource
