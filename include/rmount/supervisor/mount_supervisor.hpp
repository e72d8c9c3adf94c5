#pragma once

#include "rmount/common/result.hpp"
#include "rmount/config/schema.hpp"
#include "rmount/mount/mount_spec.hpp"
#include "rmount/mount/probe.hpp"
#include "rmount/mount/unmounter.hpp"
#include "rmount/process/process_handle.hpp"
#include "rmount/resource/managed_resource.hpp"
#include "rmount/supervisor/health_event.hpp"
#include "rmount/supervisor/health_monitor.hpp"
#include "rmount/supervisor/restart_policy.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rmount::supervisor {

enum class SupervisorState {
  Unmounted,
  Mounting,
  Mounted,
  Restarting,
  Unmounting,
  Failed,
};

[[nodiscard]] std::string_view state_name(SupervisorState state);

struct RestartState {
  std::uint32_t attempt_count = 0;
  std::optional<std::chrono::steady_clock::time_point> first_failure_time;
  std::optional<std::chrono::steady_clock::time_point> last_attempt_time;
};

struct SupervisorOptions {
  std::chrono::milliseconds poll_interval{500};
  std::chrono::milliseconds startup_timeout{30'000};
  std::chrono::milliseconds shutdown_grace{5'000};
  std::chrono::milliseconds probe_timeout{5'000};
  /// Zero derives the window as two poll intervals plus the probe timeout.
  std::chrono::milliseconds freshness_window{0};
  std::uint32_t probe_failure_threshold = 3;
  /// First delay between readiness probes; doubles up to `poll_interval`.
  std::chrono::milliseconds startup_probe_delay{50};
  std::size_t output_buffer_bytes = 64 * 1024;
  std::string mount_table = "/proc/self/mountinfo";
  RestartPolicyOptions restart;
  mount::UnmountOptions unmount;

  [[nodiscard]] std::chrono::milliseconds effective_freshness_window() const;
};

[[nodiscard]] SupervisorOptions supervisor_options_from_config(const config::Config &config);

/// Invoked once per transition into FAILED, on the thread that detected it.
using FailureCallback = std::function<void(const common::Status &)>;

struct SupervisorSnapshot {
  std::string mountpoint;
  SupervisorState state = SupervisorState::Unmounted;
  bool alive = false;
  std::uint32_t attempt_count = 0;
  std::uint64_t restarts_total = 0;
  std::optional<int> pid;
  std::string last_health;
  std::string last_error;
};

/// Keeps one external mount process alive for one mountpoint.
///
/// mount() blocks until the mount is live, has failed for good, or was
/// cancelled by unmount(). Once mounted, a HealthMonitor thread samples the
/// process and the mountpoint and drives restarts under the RestartPolicy.
/// All state transitions go through one mutex; process teardown is claimed by
/// moving the ProcessHandle out under it, so a restart and an unmount never
/// both terminate the same process.
class MountSupervisor final : public resource::ManagedResource {
public:
  /// Direct construction reserves nothing: two supervisors built this way can
  /// target the same mountpoint. Use MountRegistry::create_supervisor whenever
  /// more than one supervisor may exist; build one directly only when it is
  /// the sole owner of its mountpoint.
  MountSupervisor(std::shared_ptr<const mount::MountSpec> spec, SupervisorOptions options,
                  std::shared_ptr<mount::IMountProbe> probe = nullptr);
  ~MountSupervisor() override;

  MountSupervisor(const MountSupervisor &) = delete;
  MountSupervisor &operator=(const MountSupervisor &) = delete;

  /// AlreadyMounted unless UNMOUNTED; the stored terminal error when FAILED.
  [[nodiscard]] common::Status mount();
  /// Idempotent. Errors only when the mountpoint cannot be confirmed released.
  [[nodiscard]] common::Status unmount();
  [[nodiscard]] bool is_alive() const;

  [[nodiscard]] SupervisorState state() const;
  [[nodiscard]] RestartState restart_state() const;
  [[nodiscard]] SupervisorSnapshot snapshot() const;
  [[nodiscard]] std::vector<std::string> recent_output(std::size_t lines) const;
  [[nodiscard]] const mount::MountSpec &spec() const { return *spec_; }
  [[nodiscard]] const SupervisorOptions &options() const { return options_; }

  void set_failure_callback(FailureCallback callback);

  [[nodiscard]] std::string name() const override;
  [[nodiscard]] common::Status start() override { return mount(); }
  [[nodiscard]] resource::ResourceStatus probe() override;
  [[nodiscard]] common::Status stop() override { return unmount(); }

private:
  [[nodiscard]] bool cancelled_locked(std::uint64_t session) const;
  [[nodiscard]] common::Status start_attempt(std::uint64_t session, std::uint32_t attempt);
  [[nodiscard]] common::Status recover(std::uint64_t session, common::Status failure);
  [[nodiscard]] common::Status fail_terminal(std::uint64_t session, common::Status status);
  void teardown_process(std::uint64_t session);
  bool handle_health_failure(std::uint64_t session, const HealthEvent &event);
  bool start_monitor(std::uint64_t session);
  std::optional<int> process_exit_status();
  void remember_output(const process::ProcessHandle &handle);

  std::shared_ptr<const mount::MountSpec> spec_;
  SupervisorOptions options_;
  std::shared_ptr<mount::IMountProbe> probe_;
  RestartPolicy policy_;
  std::shared_ptr<HealthChannel> channel_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  SupervisorState state_ = SupervisorState::Unmounted;
  std::unique_ptr<process::ProcessHandle> process_;
  std::unique_ptr<HealthMonitor> monitor_;
  RestartState restart_state_;
  std::uint64_t session_ = 0;
  bool unmount_requested_ = false;
  int teardowns_in_flight_ = 0;
  common::Status terminal_error_ = common::Status::success();
  std::string last_error_;
  std::uint64_t restarts_total_ = 0;
  std::vector<std::string> last_output_;
  FailureCallback failure_callback_;
};

} // namespace rmount::supervisor
