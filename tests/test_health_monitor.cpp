#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "rmount/supervisor/health_event.hpp"
#include "rmount/supervisor/health_monitor.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

using namespace std::chrono_literals;

/// Probe whose answer the test flips at will.
class ScriptedProbe final : public rmount::mount::IMountProbe {
public:
  void set(rmount::mount::ProbeStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
  }
  void set_throw(bool value) { throw_ = value; }
  [[nodiscard]] int calls() const { return calls_.load(); }

  rmount::mount::ProbeOutcome is_mounted(const std::filesystem::path &) override {
    ++calls_;
    if (throw_.load()) {
      throw std::runtime_error("probe crashed");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return {.status = status_, .detail = ""};
  }

private:
  std::mutex mutex_;
  rmount::mount::ProbeStatus status_ = rmount::mount::ProbeStatus::Mounted;
  std::atomic<bool> throw_{false};
  std::atomic<int> calls_{0};
};

rmount::supervisor::MonitorOptions fast_monitor() {
  rmount::supervisor::MonitorOptions options;
  options.poll_interval = 20ms;
  options.probe_timeout = 500ms;
  options.probe_failure_threshold = 3;
  return options;
}

} // namespace

void register_health_monitor_tests(std::vector<rmount::tests::TestCase> &tests) {
  using rmount::tests::require;
  using rmount::testing::wait_until;
  namespace sup = rmount::supervisor;

  tests.push_back({"health_channel_keeps_only_latest_sample", [] {
                     sup::HealthChannel channel;
                     require(!channel.latest().has_value(), "empty at start");
                     channel.publish(sup::Alive{});
                     channel.publish(sup::ProcessExited{.code = 2});
                     const auto latest = channel.latest();
                     require(latest.has_value(), "has sample");
                     require(std::holds_alternative<sup::ProcessExited>(latest->event),
                             "newer sample replaced older");
                     require(latest->sequence == 2, "sequence advances");

                     require(channel.take().has_value(), "first take consumes");
                     require(!channel.take().has_value(), "second take sees nothing new");
                     require(channel.latest().has_value(), "latest still peeks");
                     channel.clear();
                     require(!channel.latest().has_value(), "cleared");
                   }});

  tests.push_back({"health_event_kind_and_detail", [] {
                     require(sup::health_event_kind(sup::Alive{}) == "alive", "alive");
                     require(sup::health_event_detail(sup::ProcessExited{.code = 9}) ==
                                 "exit code 9",
                             "exit detail");
                     require(sup::health_event_kind(sup::ProbeTimeout{.reason = "slow"}) ==
                                 "probe_timeout",
                             "timeout kind");
                   }});

  tests.push_back({"health_monitor_sample_prefers_process_exit", [] {
                     auto probe = std::make_shared<ScriptedProbe>();
                     sup::HealthMonitor monitor(
                         "/mnt/x", probe, std::make_shared<sup::HealthChannel>(),
                         []() { return std::optional<int>(1); },
                         [](const sup::HealthEvent &) { return true; }, fast_monitor());
                     const auto event = monitor.sample_once();
                     const auto *exited = std::get_if<sup::ProcessExited>(&event);
                     require(exited != nullptr && exited->code == 1, "process exit wins");
                     require(probe->calls() == 0, "probe skipped once exit is known");
                   }});

  tests.push_back({"health_monitor_classifies_probe_outcomes", [] {
                     auto probe = std::make_shared<ScriptedProbe>();
                     sup::HealthMonitor monitor(
                         "/mnt/x", probe, std::make_shared<sup::HealthChannel>(),
                         []() { return std::nullopt; },
                         [](const sup::HealthEvent &) { return true; }, fast_monitor());
                     require(sup::is_alive_event(monitor.sample_once()), "mounted is alive");
                     probe->set(rmount::mount::ProbeStatus::NotMounted);
                     require(std::holds_alternative<sup::MountpointLost>(monitor.sample_once()),
                             "not mounted is lost");
                     probe->set(rmount::mount::ProbeStatus::QueryFailed);
                     require(std::holds_alternative<sup::ProbeTimeout>(monitor.sample_once()),
                             "query failure is a probe timeout");
                   }});

  tests.push_back({"health_monitor_publishes_and_escalates_loss", [] {
                     auto probe = std::make_shared<ScriptedProbe>();
                     auto channel = std::make_shared<sup::HealthChannel>();
                     std::atomic<int> failures{0};
                     sup::HealthMonitor monitor(
                         "/mnt/x", probe, channel, []() { return std::nullopt; },
                         [&](const sup::HealthEvent &event) {
                           if (std::holds_alternative<sup::MountpointLost>(event)) {
                             ++failures;
                           }
                           return false;
                         },
                         fast_monitor());
                     monitor.start();
                     require(wait_until([&]() { return channel->latest().has_value(); }, 2s),
                             "alive sample published");
                     require(failures.load() == 0, "no failure while mounted");
                     probe->set(rmount::mount::ProbeStatus::NotMounted);
                     require(wait_until([&]() { return failures.load() == 1; }, 2s),
                             "loss escalated once");
                     require(wait_until([&]() { return !monitor.is_running(); }, 2s),
                             "handler returning false ends the loop");
                     monitor.stop();
                   }});

  tests.push_back({"health_monitor_tolerates_probe_misses_below_threshold", [] {
                     auto probe = std::make_shared<ScriptedProbe>();
                     probe->set_throw(true);
                     auto channel = std::make_shared<sup::HealthChannel>();
                     std::atomic<int> escalations{0};
                     auto options = fast_monitor();
                     options.probe_failure_threshold = 3;
                     sup::HealthMonitor monitor(
                         "/mnt/x", probe, channel, []() { return std::nullopt; },
                         [&](const sup::HealthEvent &event) {
                           require(std::holds_alternative<sup::ProbeTimeout>(event),
                                   "probe errors surface as probe_timeout");
                           ++escalations;
                           return true;
                         },
                         options);
                     monitor.start();
                     require(wait_until([&]() { return probe->calls() >= 2; }, 2s), "probing");
                     require(escalations.load() == 0 || probe->calls() >= 3,
                             "no escalation before the threshold");
                     require(wait_until([&]() { return escalations.load() >= 1; }, 2s),
                             "escalated at the threshold");
                     require(monitor.is_running(), "loop survives probe errors");
                     monitor.stop();
                     require(!monitor.is_running(), "stopped");
                   }});

  tests.push_back({"health_monitor_stop_interrupts_poll_wait", [] {
                     auto probe = std::make_shared<ScriptedProbe>();
                     auto options = fast_monitor();
                     options.poll_interval = 10s;
                     sup::HealthMonitor monitor(
                         "/mnt/x", probe, std::make_shared<sup::HealthChannel>(),
                         []() { return std::nullopt; },
                         [](const sup::HealthEvent &) { return true; }, options);
                     monitor.start();
                     require(wait_until([&]() { return probe->calls() >= 1; }, 2s), "sampled");
                     const auto started = std::chrono::steady_clock::now();
                     monitor.stop();
                     require(std::chrono::steady_clock::now() - started < 2s,
                             "stop does not wait for the poll interval");
                   }});
}
