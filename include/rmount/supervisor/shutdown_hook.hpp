#pragma once

#include "rmount/common/result.hpp"
#include "rmount/supervisor/registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace rmount::supervisor {

struct ShutdownHookOptions {
  std::vector<int> signals = {SIGINT, SIGTERM, SIGHUP};
  /// Restore the default disposition and raise the signal again once every
  /// mount is released, so the host still dies of the signal.
  bool reraise = true;
};

/// Best-effort cleanup on termination signals: handlers write the signal
/// number to a self-pipe and a watcher thread unmounts everything in the
/// registry. SIGKILL, or any other uncatchable death of the host, leaves the
/// mount processes and mountpoints behind.
///
/// Only one hook can be installed per process.
class ShutdownHook {
public:
  ShutdownHook(std::shared_ptr<MountRegistry> registry, ShutdownHookOptions options = {});
  ~ShutdownHook();

  ShutdownHook(const ShutdownHook &) = delete;
  ShutdownHook &operator=(const ShutdownHook &) = delete;

  [[nodiscard]] common::Status install();
  /// Restores the previous handlers and stops the watcher.
  void uninstall();

  [[nodiscard]] bool installed() const { return installed_; }
  [[nodiscard]] bool triggered() const { return last_signal_.load() != 0; }
  [[nodiscard]] int last_signal() const { return last_signal_.load(); }

  /// Waits until a signal has been handled (mounts already released).
  [[nodiscard]] bool wait(std::chrono::milliseconds timeout);

private:
  void watch_loop();
  void handle_signal(int signal);

  std::shared_ptr<MountRegistry> registry_;
  ShutdownHookOptions options_;
  bool installed_ = false;
  int pipe_fds_[2] = {-1, -1};
  std::map<int, struct sigaction> previous_;
  std::thread watcher_;
  std::atomic<int> last_signal_{0};
  std::mutex mutex_;
  std::condition_variable cv_;
  bool handled_ = false;
};

} // namespace rmount::supervisor
