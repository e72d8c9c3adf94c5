#include "rmount/supervisor/scoped_mount.hpp"

#include <iostream>

namespace rmount::supervisor {

common::Result<ScopedMount> ScopedMount::acquire(std::shared_ptr<MountSupervisor> supervisor) {
  if (supervisor == nullptr) {
    return common::Result<ScopedMount>::failure(common::ErrorCode::InvalidArgument,
                                                "supervisor is null");
  }
  auto status = supervisor->mount();
  if (!status.ok()) {
    // A failed acquire leaves the supervisor UNMOUNTED, never FAILED.
    const auto cleared = supervisor->unmount();
    if (!cleared.ok()) {
      std::cerr << "[supervisor] cleanup after failed mount: " << cleared.error() << "\n";
    }
    return common::Result<ScopedMount>::failure(status);
  }
  return common::Result<ScopedMount>::success(ScopedMount(std::move(supervisor)));
}

ScopedMount::ScopedMount(std::shared_ptr<MountSupervisor> supervisor)
    : supervisor_(std::move(supervisor)) {}

ScopedMount::ScopedMount(ScopedMount &&other) noexcept
    : supervisor_(std::move(other.supervisor_)) {}

ScopedMount &ScopedMount::operator=(ScopedMount &&other) noexcept {
  if (this != &other) {
    const auto status = release();
    if (!status.ok()) {
      std::cerr << "[supervisor] scoped unmount failed: " << status.error() << "\n";
    }
    supervisor_ = std::move(other.supervisor_);
  }
  return *this;
}

ScopedMount::~ScopedMount() {
  const auto status = release();
  if (!status.ok()) {
    std::cerr << "[supervisor] scoped unmount failed: " << status.error() << "\n";
  }
}

common::Status ScopedMount::release() {
  if (supervisor_ == nullptr) {
    return common::Status::success();
  }
  auto supervisor = std::move(supervisor_);
  supervisor_.reset();
  return supervisor->unmount();
}

} // namespace rmount::supervisor
