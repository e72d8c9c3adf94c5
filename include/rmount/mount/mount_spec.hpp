#pragma once

#include "rmount/common/result.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rmount::mount {

/// How to invoke one external mount process. Patterns are ECMAScript regular
/// expressions searched in each output line; an empty pattern places no
/// constraint.
struct MountSpec {
  std::string executable;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::filesystem::path mountpoint;
  std::string readiness_pattern;
  std::string failure_pattern;

  [[nodiscard]] std::vector<std::string> argv() const;
  [[nodiscard]] std::string describe() const;
};

[[nodiscard]] common::Status validate_mount_spec(const MountSpec &spec);

/// Validates `spec`, normalizes its mountpoint and freezes it for sharing
/// with a supervisor.
[[nodiscard]] common::Result<std::shared_ptr<const MountSpec>> make_mount_spec(MountSpec spec);

} // namespace rmount::mount
