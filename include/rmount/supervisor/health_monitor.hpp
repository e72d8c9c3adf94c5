#pragma once

#include "rmount/mount/probe.hpp"
#include "rmount/supervisor/health_event.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace rmount::supervisor {

struct MonitorOptions {
  std::chrono::milliseconds poll_interval{500};
  std::chrono::milliseconds probe_timeout{5'000};
  /// Consecutive ProbeTimeout samples needed before escalating.
  std::uint32_t probe_failure_threshold = 3;
};

/// std::nullopt while the supervised process runs, its exit code otherwise.
using ProcessStatusFn = std::function<std::optional<int>()>;

/// Called on the monitor thread for every escalated failure. Returning false
/// ends the monitor loop.
using FailureHandler = std::function<bool(const HealthEvent &)>;

class HealthMonitor {
public:
  HealthMonitor(std::filesystem::path mountpoint, std::shared_ptr<mount::IMountProbe> probe,
                std::shared_ptr<HealthChannel> channel, ProcessStatusFn process_status,
                FailureHandler on_failure, MonitorOptions options);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor &) = delete;
  HealthMonitor &operator=(const HealthMonitor &) = delete;

  void start();
  /// Does not wait; safe to call from the monitor thread itself.
  void request_stop();
  /// Requests a stop and joins, unless called from the monitor thread.
  void stop();

  [[nodiscard]] bool is_running() const { return running_.load(); }
  [[nodiscard]] bool on_monitor_thread() const;

  /// One classification step: process exit first, then the probe.
  [[nodiscard]] HealthEvent sample_once();

private:
  void run_loop();

  std::filesystem::path mountpoint_;
  std::shared_ptr<mount::IMountProbe> probe_;
  std::shared_ptr<HealthChannel> channel_;
  ProcessStatusFn process_status_;
  FailureHandler on_failure_;
  MonitorOptions options_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

} // namespace rmount::supervisor
