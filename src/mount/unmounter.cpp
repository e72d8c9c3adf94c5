#include "rmount/mount/unmounter.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/process/command.hpp"

#include <iostream>
#include <thread>

namespace rmount::mount {

common::Status release_mountpoint(const std::filesystem::path &path,
                                  const std::shared_ptr<IMountProbe> &probe,
                                  const UnmountOptions &options) {
  auto outcome = probe_with_timeout(probe, path, options.probe_timeout);
  if (outcome.released()) {
    return common::Status::success();
  }
  if (options.command.empty()) {
    return common::Status::error(common::ErrorCode::UnmountTimeout,
                                 path.string() + " is still " +
                                     std::string(probe_status_name(outcome.status)) +
                                     " and no unmount command is configured");
  }

  std::vector<std::string> argv = options.command;
  argv.push_back(path.string());
  std::string last_error;

  for (std::uint32_t attempt = 1; attempt <= options.attempts; ++attempt) {
    process::CommandOptions command_options;
    command_options.allow_failure = true;
    command_options.timeout = options.command_timeout;
    const auto ran = process::run_command(argv, command_options);
    if (!ran.ok()) {
      last_error = ran.error();
    } else if (ran.value().exit_code != 0) {
      last_error = common::trim(ran.value().stderr_text);
      if (last_error.empty()) {
        last_error = "exit code " + std::to_string(ran.value().exit_code);
      }
    }

    outcome = probe_with_timeout(probe, path, options.probe_timeout);
    if (outcome.released()) {
      return common::Status::success();
    }
    std::cerr << "[unmount] " << path.string() << " still "
              << probe_status_name(outcome.status) << " after attempt " << attempt << "/"
              << options.attempts << (last_error.empty() ? "" : ": " + last_error) << "\n";
    if (attempt < options.attempts) {
      std::this_thread::sleep_for(options.retry_delay);
    }
  }

  std::string message = "could not confirm " + path.string() + " released after " +
                        std::to_string(options.attempts) + " unmount attempts";
  if (!last_error.empty()) {
    message += ": " + last_error;
  }
  return common::Status::error(common::ErrorCode::UnmountTimeout, message);
}

} // namespace rmount::mount
