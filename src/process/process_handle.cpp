#include "rmount/process/process_handle.hpp"

#include "rmount/process/spawn.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rmount::process {

namespace {

constexpr auto kWaitStep = std::chrono::milliseconds(20);
constexpr int kReaderPollMs = 100;

common::Result<std::optional<std::regex>> compile_pattern(const std::string &pattern) {
  if (pattern.empty()) {
    return common::Result<std::optional<std::regex>>::success(std::nullopt);
  }
  try {
    return common::Result<std::optional<std::regex>>::success(std::regex(pattern));
  } catch (const std::regex_error &err) {
    return common::Result<std::optional<std::regex>>::failure(
        common::ErrorCode::InvalidArgument, "invalid pattern '" + pattern + "': " + err.what());
  }
}

} // namespace

std::string_view termination_name(const Termination termination) {
  switch (termination) {
  case Termination::Graceful:
    return "graceful";
  case Termination::Forced:
    return "forced";
  case Termination::AlreadyExited:
    return "already_exited";
  }
  return "unknown";
}

common::Result<std::unique_ptr<ProcessHandle>>
ProcessHandle::spawn(const std::vector<std::string> &argv, const SpawnOptions &options) {
  // Patterns are checked before anything is forked.
  const auto readiness = compile_pattern(options.readiness_pattern);
  if (!readiness.ok()) {
    return common::Result<std::unique_ptr<ProcessHandle>>::failure(readiness.status());
  }
  const auto failure = compile_pattern(options.failure_pattern);
  if (!failure.ok()) {
    return common::Result<std::unique_ptr<ProcessHandle>>::failure(failure.status());
  }

  int output_pipe[2] = {-1, -1};
  if (pipe2(output_pipe, O_CLOEXEC) != 0) {
    return common::Result<std::unique_ptr<ProcessHandle>>::failure(
        common::ErrorCode::Launch,
        std::string("failed to create output pipe: ") + std::strerror(errno));
  }

  auto pid = spawn_child(argv, options.env, output_pipe[1], output_pipe[1]);
  close(output_pipe[1]);
  if (!pid.ok()) {
    close(output_pipe[0]);
    return common::Result<std::unique_ptr<ProcessHandle>>::failure(pid.status());
  }

  std::unique_ptr<ProcessHandle> handle(new ProcessHandle(pid.value(), output_pipe[0], options));
  return common::Result<std::unique_ptr<ProcessHandle>>::success(std::move(handle));
}

common::Result<std::unique_ptr<ProcessHandle>>
ProcessHandle::start(const mount::MountSpec &spec, const std::size_t output_buffer_bytes) {
  SpawnOptions options;
  options.env = spec.env;
  options.output_buffer_bytes = output_buffer_bytes;
  options.readiness_pattern = spec.readiness_pattern;
  options.failure_pattern = spec.failure_pattern;
  return spawn(spec.argv(), options);
}

ProcessHandle::ProcessHandle(const pid_t pid, const int output_fd, const SpawnOptions &options)
    : pid_(pid), output_fd_(output_fd), output_(options.output_buffer_bytes) {
  if (!options.readiness_pattern.empty()) {
    readiness_regex_.emplace(options.readiness_pattern);
  }
  if (!options.failure_pattern.empty()) {
    failure_regex_.emplace(options.failure_pattern);
  }
  const int flags = fcntl(output_fd_, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(output_fd_, F_SETFL, flags | O_NONBLOCK);
  }
  reader_ = std::thread([this]() { read_loop(); });
}

ProcessHandle::~ProcessHandle() {
  if (!reap(false).has_value()) {
    (void)kill(-pid_, SIGKILL);
    (void)reap(true);
  }
  stop_reader_ = true;
  if (reader_.joinable()) {
    reader_.join();
  }
  close(output_fd_);
}

std::optional<int> ProcessHandle::reap(const bool block) {
  std::lock_guard<std::mutex> lock(wait_mutex_);
  if (exit_code_.has_value()) {
    return exit_code_;
  }

  int status = 0;
  pid_t waited = -1;
  do {
    waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (waited < 0 && errno == EINTR);

  if (waited == pid_) {
    exit_code_ = decode_wait_status(status);
  } else if (waited < 0 && errno == ECHILD) {
    exit_code_ = -1;
  }
  return exit_code_;
}

std::optional<int> ProcessHandle::exit_status() { return reap(false); }

common::Status ProcessHandle::send_signal(const int signal) {
  if (reap(false).has_value()) {
    return common::Status::error(common::ErrorCode::Internal,
                                 "process " + std::to_string(pid_) + " has already exited");
  }
  if (kill(-pid_, signal) == 0 || kill(pid_, signal) == 0) {
    return common::Status::success();
  }
  return common::Status::error(common::ErrorCode::Internal,
                               "kill(" + std::to_string(pid_) + ") failed: " + std::strerror(errno));
}

Termination ProcessHandle::terminate(const std::chrono::milliseconds grace) {
  if (reap(false).has_value()) {
    // Leftover group members of an exited leader.
    (void)kill(-pid_, SIGKILL);
    return Termination::AlreadyExited;
  }

  (void)kill(-pid_, SIGTERM);
  if (wait_for_exit(grace).has_value()) {
    return Termination::Graceful;
  }

  (void)kill(-pid_, SIGKILL);
  (void)kill(pid_, SIGKILL);
  (void)reap(true);
  return Termination::Forced;
}

std::optional<int> ProcessHandle::wait_for_exit(const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (const auto code = reap(false); code.has_value()) {
      return code;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(kWaitStep);
  }
}

std::string ProcessHandle::failure_line() const {
  std::lock_guard<std::mutex> lock(line_mutex_);
  return failure_line_;
}

void ProcessHandle::drain_output(const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!reader_done_.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void ProcessHandle::read_loop() {
  std::array<char, 4096> chunk{};
  while (!stop_reader_.load()) {
    struct pollfd pfd {
      .fd = output_fd_, .events = POLLIN, .revents = 0,
    };
    const int ready = poll(&pfd, 1, kReaderPollMs);
    if (ready < 0 && errno != EINTR) {
      break;
    }
    if (ready <= 0) {
      continue;
    }

    const ssize_t bytes = read(output_fd_, chunk.data(), chunk.size());
    if (bytes > 0) {
      const std::string_view data(chunk.data(), static_cast<std::size_t>(bytes));
      output_.append(data);
      std::size_t start = 0;
      while (true) {
        const auto newline = data.find('\n', start);
        if (newline == std::string_view::npos) {
          partial_line_.append(data.substr(start));
          break;
        }
        partial_line_.append(data.substr(start, newline - start));
        handle_line(partial_line_);
        partial_line_.clear();
        start = newline + 1;
      }
      continue;
    }
    if (bytes == 0) {
      break;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      break;
    }
  }

  if (!partial_line_.empty()) {
    handle_line(partial_line_);
    partial_line_.clear();
  }
  reader_done_ = true;
}

void ProcessHandle::handle_line(const std::string &line) {
  if (readiness_regex_.has_value() && !readiness_seen_.load() &&
      std::regex_search(line, *readiness_regex_)) {
    readiness_seen_ = true;
  }
  if (failure_regex_.has_value() && !failure_seen_.load() &&
      std::regex_search(line, *failure_regex_)) {
    {
      std::lock_guard<std::mutex> lock(line_mutex_);
      failure_line_ = line;
    }
    failure_seen_ = true;
  }
}

} // namespace rmount::process
