#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace rmount::supervisor {

struct Alive {};

struct ProcessExited {
  int code = 0;
};

struct MountpointLost {
  std::string detail;
};

struct ProbeTimeout {
  std::string reason;
};

using HealthEvent = std::variant<Alive, ProcessExited, MountpointLost, ProbeTimeout>;

[[nodiscard]] bool is_alive_event(const HealthEvent &event);
[[nodiscard]] std::string_view health_event_kind(const HealthEvent &event);
[[nodiscard]] std::string health_event_detail(const HealthEvent &event);

struct HealthSample {
  HealthEvent event;
  std::chrono::steady_clock::time_point observed_at;
  std::uint64_t sequence = 0;
};

/// Single-slot channel holding the most recent health sample. A newer
/// sample replaces an unconsumed one.
class HealthChannel {
public:
  void publish(HealthEvent event);

  /// Latest sample, consumed or not.
  [[nodiscard]] std::optional<HealthSample> latest() const;

  /// Latest sample if it has not been taken yet.
  [[nodiscard]] std::optional<HealthSample> take();

  void clear();

private:
  mutable std::mutex mutex_;
  std::optional<HealthSample> slot_;
  bool consumed_ = false;
  std::uint64_t next_sequence_ = 1;
};

} // namespace rmount::supervisor
