#include "rmount/observability/global.hpp"

#include <mutex>

namespace rmount::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_mount_started(const std::string &mountpoint, const std::string &executable,
                          const std::uint32_t attempt) {
  record_event(MountStartedEvent{
      .mountpoint = mountpoint, .executable = executable, .attempt = attempt});
}

void record_mount_ready(const std::string &mountpoint, const std::chrono::milliseconds startup) {
  record_event(MountReadyEvent{.mountpoint = mountpoint, .startup = startup});
}

void record_health_event(const std::string &mountpoint, const std::string &kind,
                         const std::string &detail) {
  record_event(HealthEventObserved{.mountpoint = mountpoint, .kind = kind, .detail = detail});
}

void record_restart_scheduled(const std::string &mountpoint, const std::uint32_t attempt,
                              const std::chrono::milliseconds delay) {
  record_event(RestartScheduledEvent{.mountpoint = mountpoint, .attempt = attempt, .delay = delay});
  record_metric(RestartCountMetric{.mountpoint = mountpoint, .count = attempt});
}

void record_mount_failed(const std::string &mountpoint, const std::string &reason) {
  record_event(MountFailedEvent{.mountpoint = mountpoint, .reason = reason});
}

void record_unmounted(const std::string &mountpoint, const std::string &termination) {
  record_event(UnmountedEvent{.mountpoint = mountpoint, .termination = termination});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace rmount::observability
