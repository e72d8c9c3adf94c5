#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace rmount::observability {

struct MountStartedEvent {
  std::string mountpoint;
  std::string executable;
  std::uint32_t attempt = 0;
};

struct MountReadyEvent {
  std::string mountpoint;
  std::chrono::milliseconds startup{0};
};

struct HealthEventObserved {
  std::string mountpoint;
  std::string kind;
  std::string detail;
};

struct RestartScheduledEvent {
  std::string mountpoint;
  std::uint32_t attempt = 0;
  std::chrono::milliseconds delay{0};
};

struct MountFailedEvent {
  std::string mountpoint;
  std::string reason;
};

struct UnmountedEvent {
  std::string mountpoint;
  std::string termination;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<MountStartedEvent, MountReadyEvent, HealthEventObserved, RestartScheduledEvent,
                 MountFailedEvent, UnmountedEvent, ErrorEvent>;

struct RestartCountMetric {
  std::string mountpoint;
  std::uint64_t count = 0;
};

struct ProbeLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<RestartCountMetric, ProbeLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace rmount::observability
