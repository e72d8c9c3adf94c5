#include "rmount/supervisor/registry.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/common/json.hpp"

#include <iostream>
#include <sstream>

namespace rmount::supervisor {

namespace {

std::string reservation_key(const std::filesystem::path &mountpoint) {
  return common::normalize_mountpoint(mountpoint).string();
}

} // namespace

MountRegistry::MountRegistry() : table_(std::make_shared<Table>()) {}

common::Result<std::shared_ptr<MountSupervisor>>
MountRegistry::create_supervisor(std::shared_ptr<const mount::MountSpec> spec,
                                 SupervisorOptions options,
                                 std::shared_ptr<mount::IMountProbe> probe) {
  if (spec == nullptr) {
    return common::Result<std::shared_ptr<MountSupervisor>>::failure(
        common::ErrorCode::InvalidArgument, "mount spec is null");
  }
  if (auto status = mount::validate_mount_spec(*spec); !status.ok()) {
    return common::Result<std::shared_ptr<MountSupervisor>>::failure(status);
  }

  const std::string key = reservation_key(spec->mountpoint);
  std::lock_guard<std::mutex> lock(table_->mutex);
  // An entry lives until the supervisor's deleter has finished, which
  // includes its final unmount.
  if (table_->entries.find(key) != table_->entries.end()) {
    return common::Result<std::shared_ptr<MountSupervisor>>::failure(
        common::ErrorCode::MountpointReserved, key + " is already managed by another supervisor");
  }

  std::weak_ptr<Table> weak_table = table_;
  std::shared_ptr<MountSupervisor> supervisor(
      new MountSupervisor(std::move(spec), std::move(options), std::move(probe)),
      [weak_table, key](MountSupervisor *raw) {
        delete raw;
        if (auto table = weak_table.lock()) {
          std::lock_guard<std::mutex> guard(table->mutex);
          table->entries.erase(key);
        }
      });
  table_->entries.emplace(key, supervisor);
  return common::Result<std::shared_ptr<MountSupervisor>>::success(std::move(supervisor));
}

bool MountRegistry::contains(const std::filesystem::path &mountpoint) const {
  std::lock_guard<std::mutex> lock(table_->mutex);
  return table_->entries.find(reservation_key(mountpoint)) != table_->entries.end();
}

std::shared_ptr<MountSupervisor> MountRegistry::find(const std::filesystem::path &mountpoint) const {
  std::lock_guard<std::mutex> lock(table_->mutex);
  const auto it = table_->entries.find(reservation_key(mountpoint));
  if (it == table_->entries.end()) {
    return nullptr;
  }
  return it->second.lock();
}

std::vector<std::shared_ptr<MountSupervisor>> MountRegistry::supervisors() const {
  std::vector<std::shared_ptr<MountSupervisor>> out;
  std::lock_guard<std::mutex> lock(table_->mutex);
  for (const auto &[key, weak] : table_->entries) {
    (void)key;
    if (auto supervisor = weak.lock()) {
      out.push_back(std::move(supervisor));
    }
  }
  return out;
}

std::size_t MountRegistry::size() const {
  std::lock_guard<std::mutex> lock(table_->mutex);
  return table_->entries.size();
}

common::Status MountRegistry::unmount_all() {
  auto live = supervisors();
  common::Status first_error = common::Status::success();
  for (auto &supervisor : live) {
    auto status = supervisor->unmount();
    if (!status.ok()) {
      std::cerr << "[registry] unmount of " << supervisor->spec().mountpoint.string()
                << " failed: " << status.error() << "\n";
      if (first_error.ok()) {
        first_error = status;
      }
    }
  }
  // Dropping the last reference runs the deleter, which takes the table lock.
  live.clear();
  return first_error;
}

std::string MountRegistry::snapshot_json() const {
  const auto live = supervisors();
  std::ostringstream json;
  json << "{\"mounts\":[";
  bool first = true;
  for (const auto &supervisor : live) {
    const auto snap = supervisor->snapshot();
    if (!first) {
      json << ",";
    }
    first = false;
    json << "{";
    json << "\"mountpoint\":" << common::json_quote(snap.mountpoint) << ",";
    json << "\"state\":\"" << state_name(snap.state) << "\",";
    json << "\"alive\":" << (snap.alive ? "true" : "false") << ",";
    json << "\"attempt_count\":" << snap.attempt_count << ",";
    json << "\"restarts_total\":" << snap.restarts_total;
    if (snap.pid.has_value()) {
      json << ",\"pid\":" << *snap.pid;
    }
    if (!snap.last_health.empty()) {
      json << ",\"last_health\":\"" << snap.last_health << "\"";
    }
    if (!snap.last_error.empty()) {
      json << ",\"last_error\":" << common::json_quote(snap.last_error);
    }
    json << "}";
  }
  json << "]}";
  return json.str();
}

} // namespace rmount::supervisor
