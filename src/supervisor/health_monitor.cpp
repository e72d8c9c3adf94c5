#include "rmount/supervisor/health_monitor.hpp"

#include "rmount/observability/global.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace rmount::supervisor {

HealthMonitor::HealthMonitor(std::filesystem::path mountpoint,
                             std::shared_ptr<mount::IMountProbe> probe,
                             std::shared_ptr<HealthChannel> channel,
                             ProcessStatusFn process_status, FailureHandler on_failure,
                             MonitorOptions options)
    : mountpoint_(std::move(mountpoint)), probe_(std::move(probe)), channel_(std::move(channel)),
      process_status_(std::move(process_status)), on_failure_(std::move(on_failure)),
      options_(options) {}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::start() {
  if (running_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void HealthMonitor::request_stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
}

void HealthMonitor::stop() {
  request_stop();
  if (!thread_.joinable() || on_monitor_thread()) {
    return;
  }
  try {
    thread_.join();
  } catch (const std::system_error &err) {
    std::cerr << "[monitor] join failed: " << err.what() << "\n";
  }
}

bool HealthMonitor::on_monitor_thread() const {
  return thread_.joinable() && thread_.get_id() == std::this_thread::get_id();
}

HealthEvent HealthMonitor::sample_once() {
  if (process_status_) {
    if (const auto code = process_status_(); code.has_value()) {
      return ProcessExited{.code = *code};
    }
  }

  const auto outcome = mount::probe_with_timeout(probe_, mountpoint_, options_.probe_timeout);
  switch (outcome.status) {
  case mount::ProbeStatus::Mounted:
    return Alive{};
  case mount::ProbeStatus::NotMounted:
    return MountpointLost{.detail = "not a mountpoint"};
  case mount::ProbeStatus::PathMissing:
    return MountpointLost{.detail = "path missing"};
  case mount::ProbeStatus::QueryFailed:
  case mount::ProbeStatus::TimedOut:
    break;
  }
  return ProbeTimeout{.reason = std::string(mount::probe_status_name(outcome.status)) +
                                (outcome.detail.empty() ? "" : ": " + outcome.detail)};
}

void HealthMonitor::run_loop() {
  const std::uint32_t threshold = std::max<std::uint32_t>(options_.probe_failure_threshold, 1);
  std::uint32_t probe_misses = 0;

  while (true) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_requested_) {
        break;
      }
    }

    HealthEvent event;
    try {
      event = sample_once();
    } catch (const std::exception &ex) {
      event = ProbeTimeout{.reason = std::string("sample failed: ") + ex.what()};
    }

    bool escalate = !is_alive_event(event);
    if (std::holds_alternative<ProbeTimeout>(event)) {
      ++probe_misses;
      escalate = probe_misses >= threshold;
    } else {
      probe_misses = 0;
    }

    if (channel_) {
      channel_->publish(event);
    }
    if (!is_alive_event(event)) {
      observability::record_health_event(mountpoint_.string(),
                                         std::string(health_event_kind(event)),
                                         health_event_detail(event));
    }

    if (escalate) {
      probe_misses = 0;
      bool keep_running = false;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        keep_running = !stop_requested_;
      }
      if (keep_running && on_failure_) {
        try {
          keep_running = on_failure_(event);
        } catch (const std::exception &ex) {
          std::cerr << "[monitor] failure handler threw for " << mountpoint_.string() << ": "
                    << ex.what() << "\n";
          observability::record_error("monitor", ex.what());
        }
      }
      if (!keep_running) {
        break;
      }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, options_.poll_interval, [this]() { return stop_requested_; });
  }

  running_ = false;
}

} // namespace rmount::supervisor
