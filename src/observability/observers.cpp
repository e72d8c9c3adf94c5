#include "rmount/observability/observers.hpp"

#include <iostream>
#include <type_traits>

namespace rmount::observability {

namespace {

std::string event_line(const ObserverEvent &event, std::string_view &level) {
  return std::visit(
      [&level](auto &&evt) -> std::string {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, MountStartedEvent>) {
          level = "INFO";
          return "mount.start path=" + evt.mountpoint + " exe=" + evt.executable +
                 " attempt=" + std::to_string(evt.attempt);
        } else if constexpr (std::is_same_v<T, MountReadyEvent>) {
          level = "INFO";
          return "mount.ready path=" + evt.mountpoint +
                 " startup_ms=" + std::to_string(evt.startup.count());
        } else if constexpr (std::is_same_v<T, HealthEventObserved>) {
          level = evt.kind == "alive" ? "DEBUG" : "WARN";
          std::string line = "health." + evt.kind + " path=" + evt.mountpoint;
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          return line;
        } else if constexpr (std::is_same_v<T, RestartScheduledEvent>) {
          level = "WARN";
          return "mount.restart path=" + evt.mountpoint + " attempt=" +
                 std::to_string(evt.attempt) + " delay_ms=" + std::to_string(evt.delay.count());
        } else if constexpr (std::is_same_v<T, MountFailedEvent>) {
          level = "ERROR";
          return "mount.failed path=" + evt.mountpoint + " reason=" + evt.reason;
        } else if constexpr (std::is_same_v<T, UnmountedEvent>) {
          level = "INFO";
          return "mount.unmounted path=" + evt.mountpoint + " termination=" + evt.termination;
        } else {
          level = "ERROR";
          return evt.component + ": " + evt.message;
        }
      },
      event);
}

std::string metric_line(const ObserverMetric &metric) {
  return std::visit(
      [](auto &&m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RestartCountMetric>) {
          return "metric.restart_count path=" + m.mountpoint + " value=" +
                 std::to_string(m.count);
        } else {
          return "metric.probe_latency_ms=" + std::to_string(m.latency.count());
        }
      },
      metric);
}

} // namespace

LogObserver::LogObserver(const bool verbose) : LogObserver(std::cerr, verbose) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(&out), verbose_(verbose) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::string_view level = "INFO";
  const std::string line = event_line(event, level);
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  write_line(level, line);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  if (!verbose_) {
    return;
  }
  write_line("DEBUG", metric_line(metric));
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

void LogObserver::write_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace rmount::observability
