#include "rmount/mount/probe.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/observability/global.hpp"

#include <cerrno>
#include <fstream>
#include <future>
#include <sstream>
#include <system_error>
#include <thread>

namespace rmount::mount {

namespace {

std::vector<std::string> split_fields(const std::string &line) {
  std::vector<std::string> fields;
  std::istringstream stream(line);
  std::string field;
  while (stream >> field) {
    fields.push_back(field);
  }
  return fields;
}

bool is_number(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  for (const char ch : value) {
    if (ch < '0' || ch > '9') {
      return false;
    }
  }
  return true;
}

bool is_octal_digit(const char ch) { return ch >= '0' && ch <= '7'; }

} // namespace

std::string_view probe_status_name(const ProbeStatus status) {
  switch (status) {
  case ProbeStatus::Mounted:
    return "mounted";
  case ProbeStatus::NotMounted:
    return "not_mounted";
  case ProbeStatus::PathMissing:
    return "path_missing";
  case ProbeStatus::QueryFailed:
    return "query_failed";
  case ProbeStatus::TimedOut:
    return "timed_out";
  }
  return "unknown";
}

std::string decode_mount_path(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '\\' && i + 3 < raw.size() && is_octal_digit(raw[i + 1]) &&
        is_octal_digit(raw[i + 2]) && is_octal_digit(raw[i + 3])) {
      const int value = (raw[i + 1] - '0') * 64 + (raw[i + 2] - '0') * 8 + (raw[i + 3] - '0');
      out.push_back(static_cast<char>(value));
      i += 3;
      continue;
    }
    out.push_back(raw[i]);
  }
  return out;
}

common::Result<std::vector<MountEntry>> parse_mount_table(const std::string &content) {
  std::vector<MountEntry> entries;
  std::istringstream stream(content);
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(stream, line)) {
    ++line_no;
    if (common::trim(line).empty()) {
      continue;
    }
    const auto fields = split_fields(line);

    MountEntry entry;
    // mountinfo: id parent major:minor root mountpoint options [optional...] - fstype source super
    if (fields.size() >= 7 && is_number(fields[0]) && is_number(fields[1])) {
      std::size_t sep = 6;
      while (sep < fields.size() && fields[sep] != "-") {
        ++sep;
      }
      if (sep + 2 >= fields.size()) {
        return common::Result<std::vector<MountEntry>>::failure(
            common::ErrorCode::Io, "malformed mountinfo line " + std::to_string(line_no));
      }
      entry.mountpoint = decode_mount_path(fields[4]);
      entry.options = fields[5];
      entry.fstype = fields[sep + 1];
      entry.source = decode_mount_path(fields[sep + 2]);
    } else if (fields.size() >= 4) {
      // mounts: source mountpoint fstype options dump pass
      entry.source = decode_mount_path(fields[0]);
      entry.mountpoint = decode_mount_path(fields[1]);
      entry.fstype = fields[2];
      entry.options = fields[3];
    } else {
      return common::Result<std::vector<MountEntry>>::failure(
          common::ErrorCode::Io, "malformed mount table line " + std::to_string(line_no));
    }
    entries.push_back(std::move(entry));
  }
  return common::Result<std::vector<MountEntry>>::success(std::move(entries));
}

MountTableProbe::MountTableProbe(std::filesystem::path table_path)
    : table_path_(std::move(table_path)) {}

ProbeOutcome MountTableProbe::is_mounted(const std::filesystem::path &path) {
  const auto target = common::normalize_mountpoint(path);

  std::ifstream file(table_path_);
  if (!file) {
    return ProbeOutcome{.status = ProbeStatus::QueryFailed,
                        .detail = "unable to read mount table " + table_path_.string()};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  const auto entries = parse_mount_table(buffer.str());
  if (!entries.ok()) {
    return ProbeOutcome{.status = ProbeStatus::QueryFailed, .detail = entries.error()};
  }
  for (const auto &entry : entries.value()) {
    if (common::normalize_mountpoint(entry.mountpoint) == target) {
      return ProbeOutcome{.status = ProbeStatus::Mounted, .detail = entry.fstype};
    }
  }

  std::error_code ec;
  const auto status = std::filesystem::status(target, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
      return ProbeOutcome{.status = ProbeStatus::PathMissing, .detail = target.string()};
    }
    return ProbeOutcome{.status = ProbeStatus::QueryFailed,
                        .detail = target.string() + ": " + ec.message()};
  }
  if (!std::filesystem::exists(status)) {
    return ProbeOutcome{.status = ProbeStatus::PathMissing, .detail = target.string()};
  }
  return ProbeOutcome{.status = ProbeStatus::NotMounted, .detail = ""};
}

ProbeOutcome probe_with_timeout(const std::shared_ptr<IMountProbe> &probe,
                                const std::filesystem::path &path,
                                const std::chrono::milliseconds timeout) {
  if (probe == nullptr) {
    return ProbeOutcome{.status = ProbeStatus::QueryFailed, .detail = "no probe configured"};
  }

  const auto started = std::chrono::steady_clock::now();
  auto promise = std::make_shared<std::promise<ProbeOutcome>>();
  auto future = promise->get_future();
  std::thread([probe, path, promise]() {
    try {
      promise->set_value(probe->is_mounted(path));
    } catch (const std::exception &ex) {
      promise->set_value(ProbeOutcome{.status = ProbeStatus::QueryFailed, .detail = ex.what()});
    }
  }).detach();

  if (future.wait_for(timeout) != std::future_status::ready) {
    return ProbeOutcome{.status = ProbeStatus::TimedOut,
                        .detail = "probe exceeded " + std::to_string(timeout.count()) + "ms"};
  }

  auto outcome = future.get();
  observability::record_metric(observability::ProbeLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});
  return outcome;
}

} // namespace rmount::mount
