#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rmount::config {

struct SupervisorConfig {
  double poll_interval_seconds = 0.5;
  double startup_timeout_seconds = 30.0;
  double shutdown_grace_seconds = 5.0;
  double probe_timeout_seconds = 5.0;
  // 0 derives the window from the poll interval and probe timeout.
  double freshness_window_seconds = 0.0;
  std::uint32_t probe_failure_threshold = 3;
  std::uint32_t unmount_attempts = 5;
  std::vector<std::string> unmount_command = {"fusermount", "-uz"};
  std::string mount_table = "/proc/self/mountinfo";
  std::size_t output_buffer_bytes = 64 * 1024;
};

struct RestartConfig {
  std::uint32_t max_attempts = 3;
  double window_seconds = 300.0;
  double initial_backoff_seconds = 1.0;
  double max_backoff_seconds = 30.0;
  double backoff_multiplier = 2.0;
  std::vector<double> backoff_seconds;
};

struct ObservabilityConfig {
  std::string backend = "log";
  /// Also log DEBUG lines, including one latency metric per probe.
  bool verbose = false;
};

struct RcloneConfig {
  std::string binary = "rclone";
  std::uint64_t refresh_interval_seconds = 10;
  std::string config_dir;
  /// Write `.rmount` through the remote and require it to read back fresh.
  bool heartbeat = true;
};

struct Config {
  SupervisorConfig supervisor;
  RestartConfig restart;
  ObservabilityConfig observability;
  RcloneConfig rclone;
};

} // namespace rmount::config
