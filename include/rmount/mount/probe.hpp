#pragma once

#include "rmount/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rmount::mount {

enum class ProbeStatus {
  Mounted,
  NotMounted,
  PathMissing,
  QueryFailed,
  TimedOut,
};

[[nodiscard]] std::string_view probe_status_name(ProbeStatus status);

struct ProbeOutcome {
  ProbeStatus status = ProbeStatus::QueryFailed;
  std::string detail;

  [[nodiscard]] bool mounted() const { return status == ProbeStatus::Mounted; }
  /// True when the path is known not to be a mountpoint.
  [[nodiscard]] bool released() const {
    return status == ProbeStatus::NotMounted || status == ProbeStatus::PathMissing;
  }
};

struct MountEntry {
  std::string source;
  std::filesystem::path mountpoint;
  std::string fstype;
  std::string options;
};

/// Parses either /proc/self/mountinfo or /proc/mounts formatted text.
[[nodiscard]] common::Result<std::vector<MountEntry>> parse_mount_table(const std::string &content);

/// Decodes the octal escapes (\040, \011, \012, \134) the kernel writes into
/// mount table paths.
[[nodiscard]] std::string decode_mount_path(const std::string &raw);

class IMountProbe {
public:
  virtual ~IMountProbe() = default;
  [[nodiscard]] virtual ProbeOutcome is_mounted(const std::filesystem::path &path) = 0;
};

/// Probe backed by a mount table file. The table is consulted before the
/// path is touched, so a hung mount is still reported as Mounted.
class MountTableProbe final : public IMountProbe {
public:
  explicit MountTableProbe(std::filesystem::path table_path = "/proc/self/mountinfo");

  [[nodiscard]] ProbeOutcome is_mounted(const std::filesystem::path &path) override;

private:
  std::filesystem::path table_path_;
};

/// Runs the probe on a helper thread and gives up after `timeout`, yielding
/// ProbeStatus::TimedOut. A probe stuck in the kernel keeps its thread.
[[nodiscard]] ProbeOutcome probe_with_timeout(const std::shared_ptr<IMountProbe> &probe,
                                              const std::filesystem::path &path,
                                              std::chrono::milliseconds timeout);

} // namespace rmount::mount
