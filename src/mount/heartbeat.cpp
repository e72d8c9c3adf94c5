#include "rmount/mount/heartbeat.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/observability/global.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace rmount::mount {

std::string format_heartbeat(const std::chrono::system_clock::time_point at) {
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%lld.%03lld\n", static_cast<long long>(ms / 1000),
                static_cast<long long>(ms % 1000));
  return buffer;
}

common::Result<std::chrono::system_clock::time_point> parse_heartbeat(const std::string &text) {
  using R = common::Result<std::chrono::system_clock::time_point>;
  const auto trimmed = common::trim(text);
  if (trimmed.empty()) {
    return R::failure(common::ErrorCode::Io, "heartbeat file is empty");
  }
  std::size_t used = 0;
  double seconds = 0;
  try {
    seconds = std::stod(trimmed, &used);
  } catch (const std::exception &) {
    return R::failure(common::ErrorCode::Io, "heartbeat is not a timestamp: " + trimmed);
  }
  if (used != trimmed.size() || !std::isfinite(seconds) || seconds < 0) {
    return R::failure(common::ErrorCode::Io, "heartbeat is not a timestamp: " + trimmed);
  }
  const auto since_epoch = std::chrono::milliseconds(std::llround(seconds * 1000.0));
  return R::success(std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch)));
}

HeartbeatProbe::HeartbeatProbe(std::shared_ptr<IMountProbe> inner, HeartbeatWriter writer,
                               HeartbeatOptions options)
    : inner_(std::move(inner)), writer_(std::move(writer)), options_(std::move(options)) {}

void HeartbeatProbe::refresh_if_due() {
  if (!writer_) {
    return;
  }
  const auto now = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // A write abandoned by a timed-out probe may still be running.
    if (writing_ || (last_write_.has_value() && now - *last_write_ < options_.refresh_interval)) {
      return;
    }
    writing_ = true;
    last_write_ = now;
  }

  const auto status = writer_(format_heartbeat(std::chrono::system_clock::now()));
  if (!status.ok()) {
    std::cerr << "[heartbeat] refresh failed: " << status.error() << "\n";
    observability::record_error("heartbeat", status.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  writing_ = false;
}

ProbeOutcome HeartbeatProbe::is_mounted(const std::filesystem::path &path) {
  if (inner_ == nullptr) {
    return ProbeOutcome{.status = ProbeStatus::QueryFailed, .detail = "no probe configured"};
  }
  auto outcome = inner_->is_mounted(path);
  if (!outcome.mounted()) {
    return outcome;
  }

  refresh_if_due();

  const auto file = path / options_.file_name;
  std::ifstream in(file);
  if (!in) {
    return ProbeOutcome{.status = ProbeStatus::QueryFailed,
                        .detail = "heartbeat " + file.string() + " is not readable"};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  const auto stamp = parse_heartbeat(buffer.str());
  if (!stamp.ok()) {
    return ProbeOutcome{.status = ProbeStatus::QueryFailed, .detail = stamp.error()};
  }

  const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now() - stamp.value());
  if (age > options_.max_age) {
    return ProbeOutcome{.status = ProbeStatus::QueryFailed,
                        .detail = "heartbeat is stale (" + std::to_string(age.count() / 1000) +
                                  "s old)"};
  }
  return outcome;
}

} // namespace rmount::mount
