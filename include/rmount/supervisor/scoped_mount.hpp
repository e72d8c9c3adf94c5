#pragma once

#include "rmount/common/result.hpp"
#include "rmount/supervisor/mount_supervisor.hpp"

#include <memory>

namespace rmount::supervisor {

/// Mounted for the lifetime of the object. The destructor unmounts
/// unconditionally, including during stack unwinding.
class ScopedMount {
public:
  [[nodiscard]] static common::Result<ScopedMount>
  acquire(std::shared_ptr<MountSupervisor> supervisor);

  ScopedMount(ScopedMount &&other) noexcept;
  ScopedMount &operator=(ScopedMount &&other) noexcept;
  ScopedMount(const ScopedMount &) = delete;
  ScopedMount &operator=(const ScopedMount &) = delete;
  ~ScopedMount();

  [[nodiscard]] MountSupervisor &supervisor() const { return *supervisor_; }

  /// Unmounts now and reports the result; the destructor then does nothing.
  [[nodiscard]] common::Status release();

private:
  explicit ScopedMount(std::shared_ptr<MountSupervisor> supervisor);

  std::shared_ptr<MountSupervisor> supervisor_;
};

} // namespace rmount::supervisor
