#include "rmount/supervisor/health_event.hpp"

#include <type_traits>

namespace rmount::supervisor {

bool is_alive_event(const HealthEvent &event) { return std::holds_alternative<Alive>(event); }

std::string_view health_event_kind(const HealthEvent &event) {
  return std::visit(
      [](auto &&evt) -> std::string_view {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, Alive>) {
          return "alive";
        } else if constexpr (std::is_same_v<T, ProcessExited>) {
          return "process_exited";
        } else if constexpr (std::is_same_v<T, MountpointLost>) {
          return "mountpoint_lost";
        } else {
          return "probe_timeout";
        }
      },
      event);
}

std::string health_event_detail(const HealthEvent &event) {
  return std::visit(
      [](auto &&evt) -> std::string {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, Alive>) {
          return "";
        } else if constexpr (std::is_same_v<T, ProcessExited>) {
          return "exit code " + std::to_string(evt.code);
        } else if constexpr (std::is_same_v<T, MountpointLost>) {
          return evt.detail;
        } else {
          return evt.reason;
        }
      },
      event);
}

void HealthChannel::publish(HealthEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  slot_ = HealthSample{.event = std::move(event),
                       .observed_at = std::chrono::steady_clock::now(),
                       .sequence = next_sequence_++};
  consumed_ = false;
}

std::optional<HealthSample> HealthChannel::latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slot_;
}

std::optional<HealthSample> HealthChannel::take() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!slot_.has_value() || consumed_) {
    return std::nullopt;
  }
  consumed_ = true;
  return slot_;
}

void HealthChannel::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  slot_.reset();
  consumed_ = false;
}

} // namespace rmount::supervisor
