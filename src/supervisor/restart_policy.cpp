#include "rmount/supervisor/restart_policy.hpp"

#include <algorithm>
#include <cmath>

namespace rmount::supervisor {

namespace {

std::chrono::milliseconds seconds_to_ms(const double seconds) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

} // namespace

RestartPolicy::RestartPolicy(RestartPolicyOptions options) : options_(std::move(options)) {}

RestartDecision RestartPolicy::decide(const std::uint32_t attempt_count,
                                      const std::chrono::milliseconds elapsed) const {
  if (attempt_count >= options_.max_attempts) {
    return GiveUp{.reason = "gave up after " + std::to_string(attempt_count) + " restart attempts"};
  }
  if (elapsed > options_.window) {
    return GiveUp{.reason = "restart window of " + std::to_string(options_.window.count()) +
                            "ms exceeded"};
  }
  return Retry{.delay = delay_for(attempt_count)};
}

std::chrono::milliseconds RestartPolicy::delay_for(const std::uint32_t attempt_count) const {
  if (!options_.backoff.empty()) {
    const std::size_t index =
        std::min<std::size_t>(attempt_count, options_.backoff.size() - 1);
    return options_.backoff[index];
  }

  const double factor = std::pow(std::max(options_.multiplier, 1.0), attempt_count);
  const double raw = static_cast<double>(options_.initial_backoff.count()) * factor;
  const double capped = std::min(raw, static_cast<double>(options_.max_backoff.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

RestartPolicyOptions restart_options_from_config(const config::RestartConfig &config) {
  RestartPolicyOptions options;
  options.max_attempts = config.max_attempts;
  options.window = seconds_to_ms(config.window_seconds);
  options.initial_backoff = seconds_to_ms(config.initial_backoff_seconds);
  options.max_backoff = seconds_to_ms(config.max_backoff_seconds);
  options.multiplier = config.backoff_multiplier;
  for (const double delay : config.backoff_seconds) {
    options.backoff.push_back(seconds_to_ms(delay));
  }
  return options;
}

} // namespace rmount::supervisor
