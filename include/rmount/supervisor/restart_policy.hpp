#pragma once

#include "rmount/config/schema.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace rmount::supervisor {

struct RestartPolicyOptions {
  std::uint32_t max_attempts = 3;
  std::chrono::milliseconds window{300'000};
  std::chrono::milliseconds initial_backoff{1'000};
  std::chrono::milliseconds max_backoff{30'000};
  double multiplier = 2.0;
  /// Explicit delay curve; when non-empty it replaces the exponential one and
  /// its last entry repeats.
  std::vector<std::chrono::milliseconds> backoff;
};

struct Retry {
  std::chrono::milliseconds delay{0};
};

struct GiveUp {
  std::string reason;
};

using RestartDecision = std::variant<Retry, GiveUp>;

class RestartPolicy {
public:
  explicit RestartPolicy(RestartPolicyOptions options = {});

  /// `attempt_count` restarts have already been made in this episode, the
  /// first failure of which happened `elapsed` ago.
  [[nodiscard]] RestartDecision decide(std::uint32_t attempt_count,
                                       std::chrono::milliseconds elapsed) const;

  [[nodiscard]] std::chrono::milliseconds delay_for(std::uint32_t attempt_count) const;
  [[nodiscard]] const RestartPolicyOptions &options() const { return options_; }

private:
  RestartPolicyOptions options_;
};

[[nodiscard]] RestartPolicyOptions restart_options_from_config(const config::RestartConfig &config);

} // namespace rmount::supervisor
