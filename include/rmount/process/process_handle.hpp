#pragma once

#include "rmount/common/result.hpp"
#include "rmount/mount/mount_spec.hpp"
#include "rmount/process/output_buffer.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace rmount::process {

enum class Termination {
  Graceful,
  Forced,
  AlreadyExited,
};

[[nodiscard]] std::string_view termination_name(Termination termination);

struct SpawnOptions {
  std::map<std::string, std::string> env;
  std::size_t output_buffer_bytes = 64 * 1024;
  std::string readiness_pattern;
  std::string failure_pattern;
};

/// Owns one child process running in its own process group. stdout and stderr
/// are merged into a bounded ring buffer by a reader thread, which also
/// matches each complete line against the readiness and failure patterns.
/// Destroying a handle kills and reaps the child.
class ProcessHandle {
public:
  ProcessHandle(const ProcessHandle &) = delete;
  ProcessHandle &operator=(const ProcessHandle &) = delete;
  ~ProcessHandle();

  /// Fails with ErrorCode::Launch when the executable cannot be spawned;
  /// the exec errno travels back over a close-on-exec pipe.
  [[nodiscard]] static common::Result<std::unique_ptr<ProcessHandle>>
  spawn(const std::vector<std::string> &argv, const SpawnOptions &options);

  [[nodiscard]] static common::Result<std::unique_ptr<ProcessHandle>>
  start(const mount::MountSpec &spec, std::size_t output_buffer_bytes);

  [[nodiscard]] pid_t pid() const { return pid_; }

  /// Non-blocking. std::nullopt while the child runs; otherwise its exit code,
  /// or 128 + signal number when it was killed by a signal.
  [[nodiscard]] std::optional<int> exit_status();

  [[nodiscard]] common::Status send_signal(int signal);

  /// SIGTERM, then up to `grace` for the child to exit, then SIGKILL.
  Termination terminate(std::chrono::milliseconds grace);

  /// Blocks until the child exits or `timeout` elapses.
  [[nodiscard]] std::optional<int> wait_for_exit(std::chrono::milliseconds timeout);

  [[nodiscard]] const OutputBuffer &output() const { return output_; }
  [[nodiscard]] bool readiness_seen() const { return readiness_seen_.load(); }
  [[nodiscard]] bool failure_seen() const { return failure_seen_.load(); }
  [[nodiscard]] std::string failure_line() const;

  /// Waits for the reader thread to drain the pipe; call after exit.
  void drain_output(std::chrono::milliseconds timeout);

private:
  ProcessHandle(pid_t pid, int output_fd, const SpawnOptions &options);

  void read_loop();
  void handle_line(const std::string &line);
  std::optional<int> reap(bool block);

  pid_t pid_;
  int output_fd_;
  OutputBuffer output_;
  std::optional<std::regex> readiness_regex_;
  std::optional<std::regex> failure_regex_;

  std::mutex wait_mutex_;
  std::optional<int> exit_code_;

  mutable std::mutex line_mutex_;
  std::string partial_line_;
  std::string failure_line_;
  std::atomic<bool> readiness_seen_{false};
  std::atomic<bool> failure_seen_{false};
  std::atomic<bool> reader_done_{false};
  std::atomic<bool> stop_reader_{false};
  std::thread reader_;
};

} // namespace rmount::process
