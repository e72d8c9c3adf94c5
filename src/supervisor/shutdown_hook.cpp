#include "rmount/supervisor/shutdown_hook.hpp"

#include "rmount/observability/global.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

namespace rmount::supervisor {

namespace {

std::atomic<int> g_signal_pipe{-1};
constexpr unsigned char kStopByte = 0;

void forward_signal(const int signal) {
  const int saved_errno = errno;
  const int fd = g_signal_pipe.load();
  if (fd >= 0) {
    const unsigned char byte = static_cast<unsigned char>(signal);
    ssize_t written = -1;
    do {
      written = ::write(fd, &byte, 1);
    } while (written < 0 && errno == EINTR);
  }
  errno = saved_errno;
}

} // namespace

ShutdownHook::ShutdownHook(std::shared_ptr<MountRegistry> registry, ShutdownHookOptions options)
    : registry_(std::move(registry)), options_(std::move(options)) {}

ShutdownHook::~ShutdownHook() { uninstall(); }

common::Status ShutdownHook::install() {
  if (installed_) {
    return common::Status::success();
  }
  if (registry_ == nullptr) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "registry is null");
  }
  if (g_signal_pipe.load() >= 0) {
    return common::Status::error(common::ErrorCode::Internal,
                                 "another shutdown hook is already installed");
  }
  if (pipe2(pipe_fds_, O_CLOEXEC) != 0) {
    return common::Status::error(common::ErrorCode::Io,
                                 std::string("failed to create signal pipe: ") +
                                     std::strerror(errno));
  }
  g_signal_pipe = pipe_fds_[1];

  for (const int signal : options_.signals) {
    struct sigaction action {};
    action.sa_handler = forward_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    struct sigaction previous {};
    if (sigaction(signal, &action, &previous) != 0) {
      const std::string error = std::strerror(errno);
      installed_ = true;
      uninstall();
      return common::Status::error(common::ErrorCode::Internal,
                                   "sigaction(" + std::to_string(signal) + ") failed: " + error);
    }
    previous_[signal] = previous;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    handled_ = false;
  }
  last_signal_ = 0;
  installed_ = true;
  watcher_ = std::thread([this]() { watch_loop(); });
  return common::Status::success();
}

void ShutdownHook::uninstall() {
  if (!installed_) {
    return;
  }
  for (const auto &[signal, previous] : previous_) {
    if (sigaction(signal, &previous, nullptr) != 0) {
      std::cerr << "[shutdown] failed to restore handler for signal " << signal << ": "
                << std::strerror(errno) << "\n";
    }
  }
  previous_.clear();

  if (watcher_.joinable()) {
    const unsigned char byte = kStopByte;
    ssize_t written = -1;
    do {
      written = ::write(pipe_fds_[1], &byte, 1);
    } while (written < 0 && errno == EINTR);
    if (written == 1) {
      watcher_.join();
    } else {
      std::cerr << "[shutdown] failed to wake signal watcher: " << std::strerror(errno) << "\n";
      watcher_.detach();
    }
  }

  g_signal_pipe = -1;
  for (int &fd : pipe_fds_) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
  installed_ = false;
}

bool ShutdownHook::wait(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return handled_; });
}

void ShutdownHook::watch_loop() {
  while (true) {
    unsigned char byte = 0;
    const ssize_t got = ::read(pipe_fds_[0], &byte, 1);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0 || byte == kStopByte) {
      return;
    }
    handle_signal(static_cast<int>(byte));
    if (options_.reraise) {
      return;
    }
  }
}

void ShutdownHook::handle_signal(const int signal) {
  last_signal_ = signal;
  std::cerr << "[shutdown] received " << strsignal(signal) << ", releasing "
            << registry_->size() << " mount(s)\n";
  const auto status = registry_->unmount_all();
  if (!status.ok()) {
    observability::record_error("shutdown", status.error());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    handled_ = true;
  }
  cv_.notify_all();

  if (options_.reraise) {
    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);
    (void)sigaction(signal, &action, nullptr);
    (void)::raise(signal);
  }
}

} // namespace rmount::supervisor
