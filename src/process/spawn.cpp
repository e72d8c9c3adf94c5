#include "rmount/process/spawn.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace rmount::process {

namespace {

std::vector<std::string> merged_environment(const std::map<std::string, std::string> &overrides) {
  std::map<std::string, std::string> merged;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string item(*entry);
    const auto eq = item.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }
    merged[item.substr(0, eq)] = item.substr(eq + 1);
  }
  for (const auto &[key, value] : overrides) {
    merged[key] = value;
  }

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    out.push_back(key + "=" + value);
  }
  return out;
}

[[noreturn]] void report_and_exit(const int fd) {
  const int err = errno;
  ssize_t written = -1;
  do {
    written = ::write(fd, &err, sizeof(err));
  } while (written < 0 && errno == EINTR);
  _exit(127);
}

} // namespace

common::Result<pid_t> spawn_child(const std::vector<std::string> &argv,
                                  const std::map<std::string, std::string> &env,
                                  const int stdout_fd, const int stderr_fd) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<pid_t>::failure(common::ErrorCode::Launch, "empty command line");
  }

  // Everything the child touches is prepared before fork.
  std::vector<std::string> argv_copy = argv;
  std::vector<char *> argv_c;
  argv_c.reserve(argv_copy.size() + 1);
  for (auto &arg : argv_copy) {
    argv_c.push_back(arg.data());
  }
  argv_c.push_back(nullptr);

  std::vector<std::string> envp_copy = merged_environment(env);
  std::vector<char *> envp_c;
  envp_c.reserve(envp_copy.size() + 1);
  for (auto &entry : envp_copy) {
    envp_c.push_back(entry.data());
  }
  envp_c.push_back(nullptr);

  int error_pipe[2] = {-1, -1};
  if (pipe2(error_pipe, O_CLOEXEC) != 0) {
    return common::Result<pid_t>::failure(common::ErrorCode::Launch,
                                          std::string("failed to create exec pipe: ") +
                                              std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    close(error_pipe[0]);
    close(error_pipe[1]);
    return common::Result<pid_t>::failure(common::ErrorCode::Launch,
                                          std::string("fork failed: ") + std::strerror(err));
  }

  if (pid == 0) {
    close(error_pipe[0]);
    if (setpgid(0, 0) != 0) {
      report_and_exit(error_pipe[1]);
    }
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) {
      report_and_exit(error_pipe[1]);
    }
    if (devnull != STDIN_FILENO) {
      close(devnull);
    }
    if (dup2(stdout_fd, STDOUT_FILENO) < 0 || dup2(stderr_fd, STDERR_FILENO) < 0) {
      report_and_exit(error_pipe[1]);
    }
    execvpe(argv_c[0], argv_c.data(), envp_c.data());
    report_and_exit(error_pipe[1]);
  }

  close(error_pipe[1]);
  // Closes the race where the parent signals the group before the child ran
  // setpgid. EACCES after exec is expected.
  (void)setpgid(pid, pid);

  int child_errno = 0;
  ssize_t got = -1;
  do {
    got = read(error_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  close(error_pipe[0]);

  if (got > 0) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return common::Result<pid_t>::failure(common::ErrorCode::Launch,
                                          "cannot execute '" + argv.front() +
                                              "': " + std::strerror(child_errno));
  }
  if (got < 0) {
    const int err = errno;
    (void)kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return common::Result<pid_t>::failure(common::ErrorCode::Launch,
                                          std::string("failed to read exec status: ") +
                                              std::strerror(err));
  }

  return common::Result<pid_t>::success(pid);
}

int decode_wait_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace rmount::process
