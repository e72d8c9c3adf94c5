#include "rmount/supervisor/mount_supervisor.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/observability/global.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace rmount::supervisor {

namespace {

constexpr std::size_t kRememberedOutputLines = 50;
constexpr auto kOutputDrainTimeout = std::chrono::milliseconds(200);

std::chrono::milliseconds seconds_to_ms(const double seconds) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

std::string join_lines(const std::vector<std::string> &lines) {
  std::string out;
  for (const auto &line : lines) {
    if (!out.empty()) {
      out += " | ";
    }
    out += line;
  }
  return out;
}

common::Status failure_from_event(const HealthEvent &event) {
  if (const auto *exited = std::get_if<ProcessExited>(&event)) {
    return common::Status::error(common::ErrorCode::ProcessCrashed,
                                 "mount process exited with code " + std::to_string(exited->code));
  }
  if (const auto *lost = std::get_if<MountpointLost>(&event)) {
    return common::Status::error(common::ErrorCode::MountLost, "mountpoint lost: " + lost->detail);
  }
  if (const auto *timeout = std::get_if<ProbeTimeout>(&event)) {
    return common::Status::error(common::ErrorCode::MountLost,
                                 "mountpoint unresponsive: " + timeout->reason);
  }
  return common::Status::success();
}

} // namespace

std::string_view state_name(const SupervisorState state) {
  switch (state) {
  case SupervisorState::Unmounted:
    return "unmounted";
  case SupervisorState::Mounting:
    return "mounting";
  case SupervisorState::Mounted:
    return "mounted";
  case SupervisorState::Restarting:
    return "restarting";
  case SupervisorState::Unmounting:
    return "unmounting";
  case SupervisorState::Failed:
    return "failed";
  }
  return "unknown";
}

std::chrono::milliseconds SupervisorOptions::effective_freshness_window() const {
  if (freshness_window.count() > 0) {
    return freshness_window;
  }
  return poll_interval * 2 + probe_timeout;
}

SupervisorOptions supervisor_options_from_config(const config::Config &config) {
  const auto &sup = config.supervisor;
  SupervisorOptions options;
  options.poll_interval = seconds_to_ms(sup.poll_interval_seconds);
  options.startup_timeout = seconds_to_ms(sup.startup_timeout_seconds);
  options.shutdown_grace = seconds_to_ms(sup.shutdown_grace_seconds);
  options.probe_timeout = seconds_to_ms(sup.probe_timeout_seconds);
  options.freshness_window = seconds_to_ms(sup.freshness_window_seconds);
  options.probe_failure_threshold = sup.probe_failure_threshold;
  options.output_buffer_bytes = sup.output_buffer_bytes;
  options.mount_table = sup.mount_table;
  options.restart = restart_options_from_config(config.restart);
  options.unmount.command = sup.unmount_command;
  options.unmount.attempts = sup.unmount_attempts;
  options.unmount.probe_timeout = options.probe_timeout;
  return options;
}

MountSupervisor::MountSupervisor(std::shared_ptr<const mount::MountSpec> spec,
                                 SupervisorOptions options,
                                 std::shared_ptr<mount::IMountProbe> probe)
    : spec_(std::move(spec)), options_(std::move(options)), probe_(std::move(probe)),
      policy_(options_.restart), channel_(std::make_shared<HealthChannel>()) {
  if (probe_ == nullptr) {
    probe_ = std::make_shared<mount::MountTableProbe>(options_.mount_table);
  }
}

MountSupervisor::~MountSupervisor() {
  const auto status = unmount();
  if (!status.ok()) {
    std::cerr << "[supervisor] unmount on destruction failed: " << status.error() << "\n";
  }
  std::unique_ptr<HealthMonitor> monitor;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor = std::move(monitor_);
  }
  monitor.reset();
}

bool MountSupervisor::cancelled_locked(const std::uint64_t session) const {
  return unmount_requested_ || session != session_;
}

void MountSupervisor::set_failure_callback(FailureCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_callback_ = std::move(callback);
}

common::Status MountSupervisor::mount() {
  const std::string mountpoint = spec_->mountpoint.string();
  std::unique_ptr<HealthMonitor> stale_monitor;
  std::uint64_t session = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SupervisorState::Failed) {
      return terminal_error_;
    }
    if (state_ != SupervisorState::Unmounted) {
      return common::Status::error(common::ErrorCode::AlreadyMounted,
                                   mountpoint + " is already " + std::string(state_name(state_)));
    }
    if (monitor_ && monitor_->on_monitor_thread()) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "mount() cannot be called from the health monitor thread");
    }
    stale_monitor = std::move(monitor_);
    session = ++session_;
    unmount_requested_ = false;
    state_ = SupervisorState::Mounting;
    restart_state_ = {};
    last_error_.clear();
    channel_->clear();
  }
  stale_monitor.reset();

  const auto abandon = [&](common::Status status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session == session_ && state_ == SupervisorState::Mounting) {
      state_ = SupervisorState::Unmounted;
    }
    last_error_ = status.error();
    return status;
  };

  // Anything short of a released path (a live, hung or stale mount) is
  // unmounted before a new process is started on top of it.
  const auto existing = mount::probe_with_timeout(probe_, spec_->mountpoint, options_.probe_timeout);
  if (!existing.released()) {
    std::cerr << "[supervisor] " << mountpoint << " is "
              << mount::probe_status_name(existing.status) << ", releasing it first\n";
    const auto released = mount::release_mountpoint(spec_->mountpoint, probe_, options_.unmount);
    if (!released.ok()) {
      return abandon(common::Status::error(common::ErrorCode::MountpointReserved,
                                           mountpoint + " is in use by another mount: " +
                                               released.error()));
    }
  }

  if (auto dir = common::ensure_dir(spec_->mountpoint); !dir.ok()) {
    return abandon(common::Status::error(common::ErrorCode::Io,
                                         "cannot prepare mountpoint: " + dir.error()));
  }

  auto status = start_attempt(session, 0);
  if (status.code() == common::ErrorCode::Launch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session == session_ && state_ == SupervisorState::Mounting) {
      state_ = SupervisorState::Unmounted;
    }
    last_error_ = status.error();
    observability::record_error("supervisor", status.error());
    return status;
  }
  if (!status.ok() && status.code() != common::ErrorCode::Cancelled) {
    status = recover(session, status);
  }
  if (!status.ok()) {
    return status;
  }
  if (!start_monitor(session)) {
    return common::Status::error(common::ErrorCode::Cancelled,
                                 "mount of " + mountpoint + " was cancelled by unmount()");
  }
  return common::Status::success();
}

common::Status MountSupervisor::start_attempt(const std::uint64_t session,
                                              const std::uint32_t attempt) {
  const std::string mountpoint = spec_->mountpoint.string();
  const auto cancelled = common::Status::error(
      common::ErrorCode::Cancelled, "mount of " + mountpoint + " was cancelled by unmount()");

  int pid = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_locked(session)) {
      return cancelled;
    }
    if (process_) {
      return common::Status::error(common::ErrorCode::Internal,
                                   "a mount process is already running for " + mountpoint);
    }
    state_ = SupervisorState::Mounting;
    auto handle = process::ProcessHandle::start(*spec_, options_.output_buffer_bytes);
    if (!handle.ok()) {
      last_error_ = handle.error();
      return common::Status::error(common::ErrorCode::Launch, handle.error());
    }
    process_ = std::move(handle.value());
    pid = process_->pid();
  }

  std::cerr << "[supervisor] started " << spec_->executable << " (pid " << pid << ") for "
            << mountpoint << (attempt > 0 ? ", restart " + std::to_string(attempt) : "")
            << "\n";
  observability::record_mount_started(mountpoint, spec_->executable, attempt);

  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + options_.startup_timeout;
  const auto max_delay = std::max(options_.poll_interval, options_.startup_probe_delay);
  auto delay = options_.startup_probe_delay;

  while (true) {
    std::optional<int> exit_code;
    std::string failure_line;
    std::vector<std::string> tail;
    bool failure_seen = false;
    bool ready_seen = true;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_locked(session) || !process_) {
        return cancelled;
      }
      exit_code = process_->exit_status();
      failure_seen = process_->failure_seen();
      if (failure_seen) {
        failure_line = process_->failure_line();
      }
      if (exit_code.has_value()) {
        tail = process_->output().tail_lines(3);
      }
      ready_seen = spec_->readiness_pattern.empty() || process_->readiness_seen();
    }

    if (exit_code.has_value()) {
      std::string message = "mount process exited with code " + std::to_string(*exit_code) +
                            " during startup";
      if (!tail.empty()) {
        message += ": " + join_lines(tail);
      }
      return common::Status::error(common::ErrorCode::ProcessCrashed, message);
    }
    if (failure_seen) {
      return common::Status::error(common::ErrorCode::ProcessCrashed,
                                   "mount process reported failure: " + failure_line);
    }

    if (ready_seen) {
      const auto outcome =
          mount::probe_with_timeout(probe_, spec_->mountpoint, options_.probe_timeout);
      if (outcome.mounted()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_locked(session)) {
          return cancelled;
        }
        state_ = SupervisorState::Mounted;
        restart_state_ = {};
        last_error_.clear();
        channel_->publish(Alive{});
        break;
      }
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return common::Status::error(common::ErrorCode::ReadinessTimeout,
                                   mountpoint + " did not become ready within " +
                                       std::to_string(options_.startup_timeout.count()) + "ms");
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, std::min(delay, remaining),
                     [this, session]() { return cancelled_locked(session); })) {
      return cancelled;
    }
    delay = std::min(delay * 2, max_delay);
  }

  const auto startup = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  std::cerr << "[supervisor] " << mountpoint << " is mounted (" << startup.count() << "ms)\n";
  observability::record_mount_ready(mountpoint, startup);
  return common::Status::success();
}

common::Status MountSupervisor::recover(const std::uint64_t session, common::Status failure) {
  const std::string mountpoint = spec_->mountpoint.string();
  common::Status last_failure = std::move(failure);

  while (true) {
    teardown_process(session);

    std::optional<std::string> give_up;
    std::chrono::milliseconds delay{0};
    std::uint32_t attempt = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_locked(session)) {
        return common::Status::error(common::ErrorCode::Cancelled,
                                     "restart of " + mountpoint + " was cancelled by unmount()");
      }
      last_error_ = last_failure.error();
      const auto now = std::chrono::steady_clock::now();
      if (!restart_state_.first_failure_time.has_value()) {
        restart_state_.first_failure_time = now;
      }
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          now - *restart_state_.first_failure_time);
      const auto decision = policy_.decide(restart_state_.attempt_count, elapsed);
      if (const auto *gave_up = std::get_if<GiveUp>(&decision)) {
        give_up = gave_up->reason;
      } else {
        delay = std::get<Retry>(decision).delay;
        ++restart_state_.attempt_count;
        restart_state_.last_attempt_time = now;
        ++restarts_total_;
        state_ = SupervisorState::Restarting;
        attempt = restart_state_.attempt_count;
      }
    }

    if (give_up.has_value()) {
      return fail_terminal(session, common::Status::error(common::ErrorCode::RestartsExhausted,
                                                          mountpoint + ": " + *give_up +
                                                              "; last failure: " +
                                                              last_failure.error()));
    }

    std::cerr << "[supervisor] " << mountpoint << " failed ("
              << common::error_code_name(last_failure.code()) << ": " << last_failure.error()
              << "), restart " << attempt << "/" << policy_.options().max_attempts << " in "
              << delay.count() << "ms\n";
    observability::record_restart_scheduled(mountpoint, attempt, delay);

    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_for(lock, delay, [this, session]() { return cancelled_locked(session); })) {
        return common::Status::error(common::ErrorCode::Cancelled,
                                     "restart of " + mountpoint + " was cancelled by unmount()");
      }
    }

    auto started = start_attempt(session, attempt);
    if (started.ok() || started.code() == common::ErrorCode::Cancelled) {
      return started;
    }
    if (started.code() == common::ErrorCode::Launch) {
      return fail_terminal(session, started);
    }
    last_failure = std::move(started);
  }
}

common::Status MountSupervisor::fail_terminal(const std::uint64_t session, common::Status status) {
  FailureCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_locked(session)) {
      return common::Status::error(common::ErrorCode::Cancelled,
                                   "mount of " + spec_->mountpoint.string() +
                                       " was cancelled by unmount()");
    }
    state_ = SupervisorState::Failed;
    terminal_error_ = status;
    last_error_ = status.error();
    callback = failure_callback_;
    channel_->clear();
  }
  cv_.notify_all();

  std::cerr << "[supervisor] giving up: " << status.error() << "\n";
  observability::record_mount_failed(spec_->mountpoint.string(), status.error());
  if (callback) {
    callback(status);
  }
  return status;
}

void MountSupervisor::teardown_process(const std::uint64_t session) {
  std::unique_ptr<process::ProcessHandle> process;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session != session_ || !process_) {
      return;
    }
    process = std::move(process_);
    ++teardowns_in_flight_;
  }

  const int pid = process->pid();
  const auto termination = process->terminate(options_.shutdown_grace);
  process->drain_output(kOutputDrainTimeout);
  remember_output(*process);
  process.reset();
  std::cerr << "[supervisor] mount process " << pid << " for " << spec_->mountpoint.string()
            << " stopped (" << process::termination_name(termination) << ")\n";

  const auto released = mount::release_mountpoint(spec_->mountpoint, probe_, options_.unmount);
  if (!released.ok()) {
    std::cerr << "[supervisor] " << released.error() << "\n";
    observability::record_error("supervisor", released.error());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    --teardowns_in_flight_;
  }
  cv_.notify_all();
}

bool MountSupervisor::handle_health_failure(const std::uint64_t session, const HealthEvent &event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_locked(session) || state_ != SupervisorState::Mounted) {
      return false;
    }
  }

  const auto sample = channel_->take();
  const HealthEvent &observed = sample.has_value() ? sample->event : event;
  if (is_alive_event(observed)) {
    return true;
  }

  const auto failure = failure_from_event(observed);
  std::cerr << "[monitor] " << spec_->mountpoint.string() << ": " << failure.error() << "\n";
  return recover(session, failure).ok();
}

bool MountSupervisor::start_monitor(const std::uint64_t session) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_locked(session) || state_ != SupervisorState::Mounted) {
    return false;
  }
  MonitorOptions monitor_options;
  monitor_options.poll_interval = options_.poll_interval;
  monitor_options.probe_timeout = options_.probe_timeout;
  monitor_options.probe_failure_threshold = options_.probe_failure_threshold;
  monitor_ = std::make_unique<HealthMonitor>(
      spec_->mountpoint, probe_, channel_, [this]() { return process_exit_status(); },
      [this, session](const HealthEvent &event) { return handle_health_failure(session, event); },
      monitor_options);
  monitor_->start();
  return true;
}

std::optional<int> MountSupervisor::process_exit_status() {
  std::lock_guard<std::mutex> lock(mutex_);
  // Between teardown and the next start there is no process to report on;
  // the probe decides.
  if (!process_) {
    return std::nullopt;
  }
  return process_->exit_status();
}

void MountSupervisor::remember_output(const process::ProcessHandle &handle) {
  auto lines = handle.output().tail_lines(kRememberedOutputLines);
  std::lock_guard<std::mutex> lock(mutex_);
  last_output_ = std::move(lines);
}

common::Status MountSupervisor::unmount() {
  const std::string mountpoint = spec_->mountpoint.string();
  std::unique_ptr<HealthMonitor> monitor;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SupervisorState::Unmounted && !process_ && teardowns_in_flight_ == 0) {
      return common::Status::success();
    }
    if (state_ == SupervisorState::Failed) {
      state_ = SupervisorState::Unmounted;
      terminal_error_ = common::Status::success();
      restart_state_ = {};
      ++session_;
      if (monitor_ && !monitor_->on_monitor_thread()) {
        monitor = std::move(monitor_);
      }
    } else {
      unmount_requested_ = true;
      state_ = SupervisorState::Unmounting;
      if (monitor_) {
        if (monitor_->on_monitor_thread()) {
          monitor_->request_stop();
        } else {
          monitor = std::move(monitor_);
        }
      }
    }
  }
  cv_.notify_all();

  if (monitor) {
    monitor->stop();
    monitor.reset();
  }

  std::unique_ptr<process::ProcessHandle> process;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == SupervisorState::Unmounted) {
      // Cleared a FAILED supervisor; nothing is left to terminate.
      return common::Status::success();
    }
    cv_.wait(lock, [this]() { return teardowns_in_flight_ == 0; });
    process = std::move(process_);
  }

  std::string termination = "none";
  if (process) {
    const int pid = process->pid();
    termination = std::string(process::termination_name(process->terminate(options_.shutdown_grace)));
    process->drain_output(kOutputDrainTimeout);
    remember_output(*process);
    process.reset();
    std::cerr << "[supervisor] mount process " << pid << " for " << mountpoint << " stopped ("
              << termination << ")\n";
  }

  const auto released = mount::release_mountpoint(spec_->mountpoint, probe_, options_.unmount);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SupervisorState::Unmounted;
    restart_state_ = {};
    channel_->clear();
    if (!released.ok()) {
      last_error_ = released.error();
    }
  }
  cv_.notify_all();

  observability::record_unmounted(mountpoint, termination);
  if (!released.ok()) {
    std::cerr << "[supervisor] " << released.error() << "\n";
    return released;
  }
  std::cerr << "[supervisor] " << mountpoint << " unmounted\n";
  return common::Status::success();
}

bool MountSupervisor::is_alive() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SupervisorState::Mounted) {
    return false;
  }
  const auto sample = channel_->latest();
  if (!sample.has_value() || !is_alive_event(sample->event)) {
    return false;
  }
  return std::chrono::steady_clock::now() - sample->observed_at <=
         options_.effective_freshness_window();
}

SupervisorState MountSupervisor::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

RestartState MountSupervisor::restart_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return restart_state_;
}

SupervisorSnapshot MountSupervisor::snapshot() const {
  SupervisorSnapshot snap;
  snap.mountpoint = spec_->mountpoint.string();
  snap.alive = is_alive();

  std::lock_guard<std::mutex> lock(mutex_);
  snap.state = state_;
  snap.attempt_count = restart_state_.attempt_count;
  snap.restarts_total = restarts_total_;
  if (process_) {
    snap.pid = process_->pid();
  }
  if (const auto sample = channel_->latest(); sample.has_value()) {
    snap.last_health = std::string(health_event_kind(sample->event));
  }
  snap.last_error = last_error_;
  return snap;
}

std::vector<std::string> MountSupervisor::recent_output(const std::size_t lines) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (process_) {
    return process_->output().tail_lines(lines);
  }
  if (last_output_.size() <= lines) {
    return last_output_;
  }
  return std::vector<std::string>(last_output_.end() - static_cast<std::ptrdiff_t>(lines),
                                  last_output_.end());
}

std::string MountSupervisor::name() const { return "mount:" + spec_->mountpoint.string(); }

resource::ResourceStatus MountSupervisor::probe() {
  const auto snap = snapshot();
  resource::ResourceStatus status;
  status.healthy = snap.alive;
  status.state = std::string(state_name(snap.state));
  status.detail = snap.last_error.empty() ? snap.last_health : snap.last_error;
  return status;
}

} // namespace rmount::supervisor
