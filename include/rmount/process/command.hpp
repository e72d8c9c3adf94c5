#pragma once

#include "rmount/common/result.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace rmount::process {

struct CommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  std::map<std::string, std::string> env;
};

struct CommandResult {
  int exit_code = 0;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
};

/// Runs a short-lived command to completion, killing it after
/// `options.timeout`. Unless `allow_failure` is set, a non-zero exit or a
/// timeout is reported as ErrorCode::Io.
[[nodiscard]] common::Result<CommandResult> run_command(const std::vector<std::string> &argv,
                                                        const CommandOptions &options = {});

} // namespace rmount::process
