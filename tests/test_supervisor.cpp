#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "rmount/mount/probe.hpp"
#include "rmount/supervisor/mount_supervisor.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace {

using namespace std::chrono_literals;
namespace obs = rmount::observability;
namespace sup = rmount::supervisor;

std::vector<std::chrono::milliseconds> scheduled_delays(const rmount::testing::RecordingObserver &observer) {
  std::vector<std::chrono::milliseconds> delays;
  for (const auto &event : observer.events()) {
    if (const auto *scheduled = std::get_if<obs::RestartScheduledEvent>(&event)) {
      delays.push_back(scheduled->delay);
    }
  }
  return delays;
}

std::vector<std::string> unmount_terminations(const rmount::testing::RecordingObserver &observer) {
  std::vector<std::string> out;
  for (const auto &event : observer.events()) {
    if (const auto *unmounted = std::get_if<obs::UnmountedEvent>(&event)) {
      out.push_back(unmounted->termination);
    }
  }
  return out;
}

/// Fixture script mounted somewhere other than the fixture's own directory.
std::shared_ptr<const rmount::mount::MountSpec>
spec_at(const rmount::testing::MountFixture &fixture, const std::filesystem::path &mountpoint,
        const std::string &mode) {
  rmount::mount::MountSpec spec;
  spec.executable = fixture.mount_script.string();
  spec.args = {fixture.table.path().string(), mountpoint.string(), mode,
               fixture.spawn_log.string()};
  spec.mountpoint = mountpoint;
  return rmount::mount::make_mount_spec(std::move(spec)).value();
}

rmount::mount::ProbeStatus probe_status(const rmount::testing::MountFixture &fixture) {
  rmount::mount::MountTableProbe probe(fixture.table.path());
  return probe.is_mounted(fixture.mountpoint).status;
}

} // namespace

void register_supervisor_tests(std::vector<rmount::tests::TestCase> &tests) {
  using rmount::tests::require;
  using rmount::tests::require_ok;
  using rmount::testing::count_lines;
  using rmount::testing::wait_until;
  using rmount::common::ErrorCode;

  tests.push_back({"supervisor_mounts_and_unmounts", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     sup::MountSupervisor supervisor(fixture.spec("serve"), fixture.options());

                     require(supervisor.state() == sup::SupervisorState::Unmounted, "idle");
                     require(!supervisor.is_alive(), "not alive before mount");
                     auto mounted = supervisor.mount();
                     require_ok(mounted);
                     require(supervisor.state() == sup::SupervisorState::Mounted, "mounted");
                     require(supervisor.is_alive(), "alive after mount");
                     require(guard.observer().count<obs::MountReadyEvent>() == 1, "ready event");

                     auto unmounted = supervisor.unmount();
                     require_ok(unmounted);
                     require(!supervisor.is_alive(), "not alive after unmount");
                     require(supervisor.state() == sup::SupervisorState::Unmounted, "unmounted");
                     require(probe_status(fixture) == rmount::mount::ProbeStatus::NotMounted,
                             "mountpoint released");
                     const auto terminations = unmount_terminations(guard.observer());
                     require(terminations.size() == 1 && terminations[0] == "graceful",
                             "one graceful unmount");
                   }});

  tests.push_back({"supervisor_unmount_twice_is_a_noop", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     sup::MountSupervisor supervisor(fixture.spec("serve"), fixture.options());
                     require(supervisor.mount().ok(), "mount");
                     require(supervisor.unmount().ok(), "first unmount");
                     auto second = supervisor.unmount();
                     require_ok(second);
                     require(guard.observer().count<obs::UnmountedEvent>() == 1,
                             "no second termination");
                     require(count_lines(fixture.spawn_log) == 1, "one process ever started");
                   }});

  tests.push_back({"supervisor_unmount_before_mount_succeeds", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     sup::MountSupervisor supervisor(fixture.spec("serve"), fixture.options());
                     auto status = supervisor.unmount();
                     require_ok(status);
                     require(count_lines(fixture.spawn_log) == 0, "nothing spawned");
                   }});

  tests.push_back({"supervisor_mount_twice_reports_already_mounted", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     sup::MountSupervisor supervisor(fixture.spec("serve"), fixture.options());
                     require(supervisor.mount().ok(), "first mount");
                     const auto pid = supervisor.snapshot().pid;
                     auto second = supervisor.mount();
                     require(!second.ok(), "second mount must fail");
                     require(second.code() == ErrorCode::AlreadyMounted, "already_mounted");
                     require(supervisor.snapshot().pid == pid, "first session untouched");
                     require(supervisor.is_alive(), "still alive");
                     require(count_lines(fixture.spawn_log) == 1, "no second process");
                     require(supervisor.unmount().ok(), "unmount");
                   }});

  tests.push_back({"supervisor_gives_up_after_max_attempts", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     auto options = fixture.options();
                     options.restart.max_attempts = 3;
                     options.restart.initial_backoff = 50ms;
                     options.restart.max_backoff = 1s;
                     sup::MountSupervisor supervisor(fixture.spec("exit"), options);

                     std::atomic<int> callbacks{0};
                     ErrorCode reported = ErrorCode::None;
                     supervisor.set_failure_callback([&](const rmount::common::Status &status) {
                       ++callbacks;
                       reported = status.code();
                     });

                     const auto started = std::chrono::steady_clock::now();
                     auto status = supervisor.mount();
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(!status.ok(), "mount must fail");
                     require(status.code() == ErrorCode::RestartsExhausted,
                             "restarts_exhausted, got " +
                                 std::string(rmount::common::error_code_name(status.code())));
                     require(status.error().find("exited with code 3") != std::string::npos,
                             "last failure kept: " + status.error());
                     require(supervisor.state() == sup::SupervisorState::Failed, "failed");
                     require(!supervisor.is_alive(), "failed is never alive");
                     require(supervisor.snapshot().restarts_total == 3, "exactly three restarts");
                     require(count_lines(fixture.spawn_log) == 4, "initial start plus restarts");

                     const auto delays = scheduled_delays(guard.observer());
                     require(delays.size() == 3, "three scheduled restarts");
                     require(delays[0] == 50ms && delays[1] == 100ms && delays[2] == 200ms,
                             "exponential delays");
                     require(elapsed >= 350ms, "delays honoured");
                     require(callbacks.load() == 1, "failure callback exactly once");
                     require(reported == ErrorCode::RestartsExhausted, "callback status");
                     require(guard.observer().count<obs::MountFailedEvent>() == 1, "failed event");

                     auto again = supervisor.mount();
                     require(again.code() == ErrorCode::RestartsExhausted,
                             "terminal error is sticky");
                     require(count_lines(fixture.spawn_log) == 4, "no spawn while failed");
                     require(callbacks.load() == 1, "callback not repeated");

                     auto cleared = supervisor.unmount();
                     require_ok(cleared);
                     require(supervisor.state() == sup::SupervisorState::Unmounted, "cleared");
                     require(guard.observer().count<obs::UnmountedEvent>() == 0,
                             "nothing terminated when clearing a failure");
                   }});

  tests.push_back({"supervisor_readiness_timeout_takes_restart_path", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     auto options = fixture.options();
                     options.startup_timeout = 300ms;
                     options.restart.max_attempts = 1;
                     options.shutdown_grace = 200ms;
                     sup::MountSupervisor supervisor(fixture.spec("silent"), options);

                     auto status = supervisor.mount();
                     require(status.code() == ErrorCode::RestartsExhausted, "exhausted");
                     require(status.error().find("did not become ready") != std::string::npos,
                             "readiness timeout recorded: " + status.error());
                     require(count_lines(fixture.spawn_log) == 2, "one restart attempted");
                     require(guard.observer().count<obs::RestartScheduledEvent>() == 1,
                             "restart scheduled");
                     require(supervisor.unmount().ok(), "clear failure");
                   }});

  tests.push_back({"supervisor_launch_error_is_returned_without_restart", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::mount::MountSpec spec;
                     spec.executable = (workspace.path() / "missing-binary").string();
                     spec.mountpoint = fixture.mountpoint;
                     auto made = rmount::mount::make_mount_spec(spec);
                     require_ok(made);
                     sup::MountSupervisor supervisor(made.value(), fixture.options());
                     auto status = supervisor.mount();
                     require(status.code() == ErrorCode::Launch, "launch_error");
                     require(supervisor.state() == sup::SupervisorState::Unmounted,
                             "back to unmounted");
                     require(supervisor.restart_state().attempt_count == 0, "no restarts");
                   }});

  tests.push_back({"supervisor_unmount_cancels_pending_restart", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     auto options = fixture.options();
                     options.restart.max_attempts = 5;
                     options.restart.initial_backoff = 5s;
                     options.restart.max_backoff = 5s;
                     auto supervisor =
                         std::make_shared<sup::MountSupervisor>(fixture.spec("exit"), options);

                     auto pending = std::async(std::launch::async,
                                               [supervisor]() { return supervisor->mount(); });
                     require(wait_until(
                                 [&]() {
                                   return guard.observer().count<obs::RestartScheduledEvent>() ==
                                          1;
                                 },
                                 5s),
                             "restart scheduled");
                     require(supervisor->state() == sup::SupervisorState::Restarting,
                             "restarting");

                     const auto started = std::chrono::steady_clock::now();
                     auto unmounted = supervisor->unmount();
                     require_ok(unmounted);
                     require(pending.wait_for(2s) == std::future_status::ready,
                             "mount returns promptly");
                     require(std::chrono::steady_clock::now() - started < 3s,
                             "backoff sleep interrupted");
                     require(pending.get().code() == ErrorCode::Cancelled, "cancelled");
                     require(supervisor->state() == sup::SupervisorState::Unmounted, "unmounted");

                     std::this_thread::sleep_for(300ms);
                     require(count_lines(fixture.spawn_log) == 1, "no process after unmount");
                     require(!supervisor->snapshot().pid.has_value(), "no live process");
                   }});

  tests.push_back({"supervisor_concurrent_unmount_never_leaves_two_processes", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     auto options = fixture.options();
                     options.restart.max_attempts = 50;
                     options.restart.initial_backoff = 0ms;
                     options.restart.max_backoff = 0ms;
                     auto supervisor =
                         std::make_shared<sup::MountSupervisor>(fixture.spec("exit"), options);

                     auto pending = std::async(std::launch::async,
                                               [supervisor]() { return supervisor->mount(); });
                     require(wait_until([&]() { return count_lines(fixture.spawn_log) >= 3; },
                                        5s),
                             "restart loop running");
                     auto unmounted = supervisor->unmount();
                     require_ok(unmounted);
                     require(pending.wait_for(5s) == std::future_status::ready, "mount returned");
                     const auto result = pending.get();
                     require(result.code() == ErrorCode::Cancelled ||
                                 result.code() == ErrorCode::RestartsExhausted,
                             "mount ends cancelled");
                     const auto spawned = count_lines(fixture.spawn_log);
                     std::this_thread::sleep_for(300ms);
                     require(count_lines(fixture.spawn_log) == spawned, "no spawn after unmount");
                     require(!supervisor->snapshot().pid.has_value(), "no process left");
                   }});

  tests.push_back({"supervisor_recovers_lost_mount", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     auto options = fixture.options();
                     options.restart.max_attempts = 2;
                     sup::MountSupervisor supervisor(fixture.spec("flaky"), options);

                     require(supervisor.mount().ok(), "mount");
                     require(wait_until([&]() { return count_lines(fixture.spawn_log) >= 2; }, 5s),
                             "crashed mount restarted by the monitor");
                     require(wait_until(
                                 [&]() {
                                   return supervisor.state() == sup::SupervisorState::Mounted &&
                                          supervisor.snapshot().restarts_total >= 1;
                                 },
                                 5s),
                             "mounted again");
                     require(guard.observer().count<obs::HealthEventObserved>() >= 1,
                             "failure observed");
                     require(supervisor.unmount().ok(), "unmount");
                     require(!supervisor.is_alive(), "not alive");
                   }});

  tests.push_back({"supervisor_attempt_count_resets_on_recovery", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     auto options = fixture.options();
                     options.restart.max_attempts = 1;
                     sup::MountSupervisor supervisor(fixture.spec("flaky"), options);

                     require(supervisor.mount().ok(), "mount");
                     // Each flaky process dies after a second; with a single allowed
                     // restart only a reset counter keeps the mount going.
                     require(wait_until([&]() { return count_lines(fixture.spawn_log) >= 3; }, 8s),
                             "survived more crashes than max_attempts");
                     require(supervisor.state() != sup::SupervisorState::Failed, "not failed");
                     require(supervisor.unmount().ok(), "unmount");
                   }});

  tests.push_back({"supervisor_forces_stubborn_process_and_runs_unmount_command", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     auto options = fixture.options();
                     options.shutdown_grace = 200ms;
                     sup::MountSupervisor supervisor(fixture.spec("stubborn"), options);
                     require(supervisor.mount().ok(), "mount");
                     auto status = supervisor.unmount();
                     require_ok(status);
                     const auto terminations = unmount_terminations(guard.observer());
                     require(terminations.size() == 1 && terminations[0] == "forced", "forced");
                     require(!fixture.table.contains(fixture.mountpoint),
                             "unmount command removed the entry");
                   }});

  tests.push_back({"supervisor_reports_unreleasable_mountpoint", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     auto options = fixture.options();
                     options.shutdown_grace = 200ms;
                     options.unmount.command = {"/bin/false"};
                     options.unmount.attempts = 2;
                     sup::MountSupervisor supervisor(fixture.spec("stubborn"), options);
                     require(supervisor.mount().ok(), "mount");
                     auto status = supervisor.unmount();
                     require(!status.ok(), "release cannot be confirmed");
                     require(status.code() == ErrorCode::UnmountTimeout, "unmount_timeout");
                     require(supervisor.state() == sup::SupervisorState::Unmounted,
                             "process is gone either way");
                     fixture.table.remove(fixture.mountpoint);
                   }});

  tests.push_back({"supervisor_releases_stale_mount_before_starting", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     fixture.table.add(fixture.mountpoint);
                     sup::MountSupervisor supervisor(fixture.spec("serve"), fixture.options());
                     auto status = supervisor.mount();
                     require_ok(status);
                     require(supervisor.unmount().ok(), "unmount");
                     require(!fixture.table.contains(fixture.mountpoint), "released");
                   }});

  tests.push_back({"supervisor_rejects_mountpoint_held_by_foreign_mount", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     fixture.table.add(fixture.mountpoint);
                     auto options = fixture.options();
                     options.unmount.command = {"/bin/false"};
                     options.unmount.attempts = 1;
                     sup::MountSupervisor supervisor(fixture.spec("serve"), options);
                     auto status = supervisor.mount();
                     require(status.code() == ErrorCode::MountpointReserved,
                             "mountpoint_reserved");
                     require(count_lines(fixture.spawn_log) == 0, "nothing spawned");
                     require(supervisor.state() == sup::SupervisorState::Unmounted, "unmounted");
                   }});

  tests.push_back({"supervisor_is_a_managed_resource", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     sup::MountSupervisor supervisor(fixture.spec("serve"), fixture.options());
                     rmount::resource::ManagedResource &resource = supervisor;
                     require(resource.name() == "mount:" + fixture.mountpoint.string(), "name");
                     require(resource.start().ok(), "start mounts");
                     const auto status = resource.probe();
                     require(status.healthy, "healthy");
                     require(status.state == "mounted", "state");
                     require(resource.stop().ok(), "stop unmounts");
                     require(!resource.probe().healthy, "unhealthy after stop");
                   }});

  tests.push_back({"supervisor_destructor_unmounts", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     {
                       sup::MountSupervisor supervisor(fixture.spec("serve"), fixture.options());
                       require(supervisor.mount().ok(), "mount");
                       require(fixture.table.contains(fixture.mountpoint), "mounted");
                     }
                     require(!fixture.table.contains(fixture.mountpoint), "released on scope exit");
                   }});

  tests.push_back({"supervisor_keeps_recent_output", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     sup::MountSupervisor supervisor(fixture.spec("serve"), fixture.options());
                     require(supervisor.mount().ok(), "mount");
                     require(wait_until(
                                 [&]() {
                                   const auto lines = supervisor.recent_output(5);
                                   return !lines.empty() && lines.back() == "mount ready";
                                 },
                                 2s),
                             "output captured while running");
                     require(supervisor.unmount().ok(), "unmount");
                     // The shell may report its killed child after the last line.
                     const auto lines = supervisor.recent_output(5);
                     require(std::find(lines.begin(), lines.end(), "mount ready") != lines.end(),
                             "output kept after unmount");
                   }});

  tests.push_back({"supervisor_creates_missing_mountpoint", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     const auto target = workspace.path() / "not" / "yet" / "there";
                     sup::MountSupervisor supervisor(spec_at(fixture, target, "serve"),
                                                     fixture.options());
                     auto status = supervisor.mount();
                     require_ok(status);
                     require(std::filesystem::is_directory(target), "mountpoint created");
                     require(fixture.table.contains(target), "mounted at the new directory");
                     require(supervisor.unmount().ok(), "unmount");
                     require(!fixture.table.contains(target), "released");
                   }});

  tests.push_back({"supervisor_reports_unusable_mountpoint_as_io", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     workspace.create_file("plain", "not a directory");
                     const auto target = workspace.path() / "plain" / "mnt";
                     sup::MountSupervisor supervisor(spec_at(fixture, target, "serve"),
                                                     fixture.options());
                     auto status = supervisor.mount();
                     require(status.code() == ErrorCode::Io,
                             "io, got " +
                                 std::string(rmount::common::error_code_name(status.code())));
                     require(count_lines(fixture.spawn_log) == 0, "nothing spawned");
                     require(supervisor.state() == sup::SupervisorState::Unmounted, "unmounted");
                     require(supervisor.snapshot().last_error.find("cannot prepare mountpoint") !=
                                 std::string::npos,
                             "error kept");
                   }});

  tests.push_back({"supervisor_monitor_gives_up_after_max_attempts", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     auto options = fixture.options();
                     options.restart.max_attempts = 2;
                     sup::MountSupervisor supervisor(fixture.spec("once"), options);

                     std::atomic<int> callbacks{0};
                     std::atomic<bool> on_caller_thread{false};
                     const auto caller = std::this_thread::get_id();
                     supervisor.set_failure_callback([&](const rmount::common::Status &) {
                       ++callbacks;
                       on_caller_thread = std::this_thread::get_id() == caller;
                     });

                     require_ok(supervisor.mount());
                     require(supervisor.state() == sup::SupervisorState::Mounted, "mounted");
                     require(wait_until(
                                 [&]() {
                                   return supervisor.state() == sup::SupervisorState::Failed;
                                 },
                                 8s),
                             "monitor drove the mount to failed");
                     require(wait_until([&]() { return callbacks.load() == 1; }, 1s),
                             "callback ran");
                     std::this_thread::sleep_for(300ms);
                     require(callbacks.load() == 1, "callback exactly once");
                     require(!on_caller_thread.load(), "callback ran on the monitor thread");
                     require(count_lines(fixture.spawn_log) == 3, "initial start plus restarts");
                     require(supervisor.snapshot().restarts_total == 2, "two restarts");
                     require(!supervisor.is_alive(), "failed is never alive");
                     require(guard.observer().count<obs::MountFailedEvent>() == 1, "failed event");
                     require(supervisor.mount().code() == ErrorCode::RestartsExhausted,
                             "terminal error is sticky");

                     require_ok(supervisor.unmount());
                     require(supervisor.state() == sup::SupervisorState::Unmounted,
                             "unmount clears failed");
                     require(count_lines(fixture.spawn_log) == 3, "no spawn after giving up");
                   }});

  tests.push_back({"supervisor_unmount_cancels_monitor_restart_backoff", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     auto options = fixture.options();
                     options.restart.initial_backoff = 5s;
                     options.restart.max_backoff = 5s;
                     sup::MountSupervisor supervisor(fixture.spec("flaky"), options);

                     std::atomic<int> callbacks{0};
                     supervisor.set_failure_callback(
                         [&](const rmount::common::Status &) { ++callbacks; });

                     require_ok(supervisor.mount());
                     require(wait_until(
                                 [&]() {
                                   return guard.observer().count<obs::RestartScheduledEvent>() ==
                                          1;
                                 },
                                 4s),
                             "monitor scheduled a restart");

                     const auto started = std::chrono::steady_clock::now();
                     require_ok(supervisor.unmount());
                     require(std::chrono::steady_clock::now() - started < 2s,
                             "unmount does not wait out the backoff");
                     require(supervisor.state() == sup::SupervisorState::Unmounted, "unmounted");

                     std::this_thread::sleep_for(300ms);
                     require(count_lines(fixture.spawn_log) == 1, "no respawn");
                     require(!fixture.table.contains(fixture.mountpoint), "mountpoint released");
                     require(callbacks.load() == 0, "cancelled restart is not a failure");
                   }});

  tests.push_back({"supervisor_steady_mount_never_reports_a_phantom_exit", [] {
                     rmount::testing::TempWorkspace workspace;
                     rmount::testing::MountFixture fixture(workspace);
                     rmount::testing::ObserverGuard guard;
                     sup::MountSupervisor supervisor(fixture.spec("serve"), fixture.options());
                     require_ok(supervisor.mount());
                     // Several monitor polls while mounted.
                     std::this_thread::sleep_for(700ms);
                     require(supervisor.state() == sup::SupervisorState::Mounted, "still mounted");
                     require(supervisor.snapshot().restarts_total == 0, "no restart");
                     require_ok(supervisor.unmount());
                     std::this_thread::sleep_for(300ms);
                     require(guard.observer().count<obs::RestartScheduledEvent>() == 0,
                             "teardown did not look like a crash");
                     require(count_lines(fixture.spawn_log) == 1, "one process ever started");
                   }});
}
