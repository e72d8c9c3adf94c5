#include "rmount/process/command.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/process/spawn.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rmount::process {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_available(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    return;
  }
}

void close_pipe(int (&fds)[2]) {
  for (int &fd : fds) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

} // namespace

common::Result<CommandResult> run_command(const std::vector<std::string> &argv,
                                          const CommandOptions &options) {
  if (argv.empty()) {
    return common::Result<CommandResult>::failure(common::ErrorCode::InvalidArgument,
                                                  "command is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<CommandResult>::failure(
        common::ErrorCode::Launch, std::string("failed to create pipes: ") + std::strerror(err));
  }

  const auto spawned = spawn_child(argv, options.env, stdout_pipe[1], stderr_pipe[1]);
  close(stdout_pipe[1]);
  stdout_pipe[1] = -1;
  close(stderr_pipe[1]);
  stderr_pipe[1] = -1;
  if (!spawned.ok()) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<CommandResult>::failure(spawned.status());
  }
  const pid_t pid = spawned.value();

  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  CommandResult result;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    read_available(stdout_pipe[0], result.stdout_text);
    read_available(stderr_pipe[0], result.stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      status = 0;
      result.exit_code = -1;
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > options.timeout) {
      result.timed_out = true;
      (void)kill(-pid, SIGKILL);
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_available(stdout_pipe[0], result.stdout_text);
  read_available(stderr_pipe[0], result.stderr_text);
  close_pipe(stdout_pipe);
  close_pipe(stderr_pipe);

  if (result.exit_code == 0) {
    result.exit_code = decode_wait_status(status);
  }

  if (result.timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return common::Result<CommandResult>::failure(
          common::ErrorCode::Io, "command timed out: " + common::join_args(argv));
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string detail = common::trim(result.stderr_text);
    return common::Result<CommandResult>::failure(
        common::ErrorCode::Io, detail.empty() ? "command failed: " + common::join_args(argv)
                                              : detail);
  }

  return common::Result<CommandResult>::success(std::move(result));
}

} // namespace rmount::process
