#pragma once

#include "rmount/common/result.hpp"

#include <map>
#include <string>
#include <vector>

#include <sys/types.h>

namespace rmount::process {

/// Forks and execs `argv` with the current environment plus `env`, stdin on
/// /dev/null and stdout/stderr on the given descriptors. The child leads a new
/// process group. Exec failure is reported as ErrorCode::Launch with the
/// child's errno.
[[nodiscard]] common::Result<pid_t> spawn_child(const std::vector<std::string> &argv,
                                                const std::map<std::string, std::string> &env,
                                                int stdout_fd, int stderr_fd);

/// Exit code from a waitpid status: the exit status, or 128 + signal.
[[nodiscard]] int decode_wait_status(int status);

} // namespace rmount::process
