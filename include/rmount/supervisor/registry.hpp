#pragma once

#include "rmount/common/result.hpp"
#include "rmount/mount/mount_spec.hpp"
#include "rmount/mount/probe.hpp"
#include "rmount/supervisor/mount_supervisor.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rmount::supervisor {

/// Owns the mountpoint reservations of every supervisor it creates. A
/// mountpoint stays reserved until its supervisor is destroyed, so two
/// supervisors never target the same path.
class MountRegistry {
public:
  MountRegistry();

  /// The only construction path that reserves the mountpoint. Fails with
  /// ErrorCode::MountpointReserved when another live supervisor already owns
  /// the MountSpec's mountpoint.
  [[nodiscard]] common::Result<std::shared_ptr<MountSupervisor>>
  create_supervisor(std::shared_ptr<const mount::MountSpec> spec, SupervisorOptions options,
                    std::shared_ptr<mount::IMountProbe> probe = nullptr);

  [[nodiscard]] bool contains(const std::filesystem::path &mountpoint) const;
  [[nodiscard]] std::shared_ptr<MountSupervisor> find(const std::filesystem::path &mountpoint) const;
  [[nodiscard]] std::vector<std::shared_ptr<MountSupervisor>> supervisors() const;
  [[nodiscard]] std::size_t size() const;

  /// Unmounts every live supervisor, continuing past failures. Returns the
  /// first error seen.
  [[nodiscard]] common::Status unmount_all();

  [[nodiscard]] std::string snapshot_json() const;

private:
  struct Table {
    std::mutex mutex;
    std::map<std::string, std::weak_ptr<MountSupervisor>> entries;
  };

  std::shared_ptr<Table> table_;
};

} // namespace rmount::supervisor
