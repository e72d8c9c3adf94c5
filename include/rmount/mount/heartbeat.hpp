#pragma once

#include "rmount/common/result.hpp"
#include "rmount/mount/probe.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rmount::mount {

inline constexpr const char *kHeartbeatFile = ".rmount";

/// Publishes `timestamp` to the remote side of the mount.
using HeartbeatWriter = std::function<common::Status(const std::string &timestamp)>;

struct HeartbeatOptions {
  std::string file_name = kHeartbeatFile;
  /// Minimum time between two writer calls.
  std::chrono::milliseconds refresh_interval{10'000};
  /// Oldest timestamp still read back as alive.
  std::chrono::milliseconds max_age{30'000};
};

/// Seconds since the epoch with millisecond precision, newline terminated.
[[nodiscard]] std::string format_heartbeat(std::chrono::system_clock::time_point at);
[[nodiscard]] common::Result<std::chrono::system_clock::time_point>
parse_heartbeat(const std::string &text);

/// Data-plane check on top of a mount table probe. A listed mount only counts
/// as Mounted when the heartbeat file read through it is fresh, so a mount
/// whose process lost the remote (network, credentials) is reported as
/// QueryFailed. A read that hangs is caught by probe_with_timeout.
class HeartbeatProbe final : public IMountProbe {
public:
  /// `writer` may be empty when something else keeps the file fresh.
  HeartbeatProbe(std::shared_ptr<IMountProbe> inner, HeartbeatWriter writer,
                 HeartbeatOptions options);

  [[nodiscard]] ProbeOutcome is_mounted(const std::filesystem::path &path) override;

private:
  void refresh_if_due();

  std::shared_ptr<IMountProbe> inner_;
  HeartbeatWriter writer_;
  HeartbeatOptions options_;

  std::mutex mutex_;
  bool writing_ = false;
  std::optional<std::chrono::steady_clock::time_point> last_write_;
};

} // namespace rmount::mount
