#pragma once

#include "rmount/common/result.hpp"
#include "rmount/mount/probe.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rmount::mount {

struct UnmountOptions {
  std::vector<std::string> command = {"fusermount", "-uz"};
  std::uint32_t attempts = 5;
  std::chrono::milliseconds retry_delay{200};
  std::chrono::milliseconds command_timeout{10'000};
  std::chrono::milliseconds probe_timeout{5'000};
};

/// Makes sure `path` is no longer a mountpoint. Runs the unmount command
/// (with the path appended) while the probe still reports it mounted, up to
/// `attempts` times. Fails with ErrorCode::UnmountTimeout when release cannot
/// be confirmed.
[[nodiscard]] common::Status release_mountpoint(const std::filesystem::path &path,
                                                const std::shared_ptr<IMountProbe> &probe,
                                                const UnmountOptions &options);

} // namespace rmount::mount
