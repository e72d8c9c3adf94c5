#include "rmount/server/docker.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/process/command.hpp"

namespace rmount::server {

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<DockerProcessResult>::failure(common::ErrorCode::InvalidArgument,
                                                        "docker command is empty");
  }

  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(binary_);
  argv.insert(argv.end(), args.begin(), args.end());

  process::CommandOptions command_options;
  command_options.allow_failure = true;
  command_options.timeout = options.timeout;
  auto ran = process::run_command(argv, command_options);
  if (!ran.ok()) {
    return common::Result<DockerProcessResult>::failure(ran.status());
  }

  DockerProcessResult result;
  result.exit_code = ran.value().timed_out ? -1 : ran.value().exit_code;
  result.stdout_text = std::move(ran.value().stdout_text);
  result.stderr_text = std::move(ran.value().stderr_text);

  if (ran.value().timed_out && !options.allow_failure) {
    return common::Result<DockerProcessResult>::failure(
        common::ErrorCode::Io, "docker command timed out: " + common::join_args(args));
  }
  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "docker command failed: " + common::join_args(args)
                                    : common::trim(result.stderr_text);
    return common::Result<DockerProcessResult>::failure(common::ErrorCode::Io, message);
  }
  return common::Result<DockerProcessResult>::success(std::move(result));
}

} // namespace rmount::server
