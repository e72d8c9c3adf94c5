#include "rmount/server/sftp_server.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/common/random.hpp"
#include "rmount/observability/global.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace rmount::server {

namespace {

common::Result<std::string> read_public_key(const SftpServerOptions &options) {
  if (options.public_key.has_value() == options.public_key_file.has_value()) {
    return common::Result<std::string>::failure(
        common::ErrorCode::InvalidArgument,
        "must provide exactly one of public_key or public_key_file");
  }
  if (options.public_key.has_value()) {
    return common::Result<std::string>::success(common::trim(*options.public_key));
  }
  std::ifstream file(*options.public_key_file);
  if (!file) {
    return common::Result<std::string>::failure(
        common::ErrorCode::Io, "unable to read public key " + options.public_key_file->string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return common::Result<std::string>::success(common::trim(buffer.str()));
}

} // namespace

common::Result<std::unique_ptr<SftpTestServer>>
SftpTestServer::create(SftpServerOptions options, std::shared_ptr<IDockerRunner> runner) {
  using R = common::Result<std::unique_ptr<SftpTestServer>>;
  if (runner == nullptr) {
    return R::failure(common::ErrorCode::InvalidArgument, "docker runner is required");
  }
  if (options.user.empty()) {
    return R::failure(common::ErrorCode::InvalidArgument, "user must not be empty");
  }
  if (options.user == "root") {
    return R::failure(common::ErrorCode::InvalidArgument, "user cannot be root");
  }
  if (options.local_path.has_value() == options.volume_name.has_value()) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "must provide exactly one of local_path or volume_name");
  }
  if (options.volume_name.has_value() && !options.remote_path.has_value()) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "remote_path is required with volume_name");
  }
  if (options.start_retries <= 0 || options.remove_retries <= 0) {
    return R::failure(common::ErrorCode::InvalidArgument, "retry counts must be positive");
  }

  auto key = read_public_key(options);
  if (!key.ok()) {
    return R::failure(key.status());
  }
  if (key.value().empty()) {
    return R::failure(common::ErrorCode::InvalidArgument, "public key must not be empty");
  }

  if (options.local_path.has_value()) {
    options.local_path = common::normalize_mountpoint(*options.local_path);
    if (!options.remote_path.has_value()) {
      options.remote_path = options.local_path->string();
    }
  }
  if (options.container_name.empty()) {
    try {
      options.container_name = common::random_uuid();
    } catch (const std::runtime_error &err) {
      return R::failure(common::ErrorCode::Internal, err.what());
    }
  }
  if (options.use_current_ids) {
    options.uid = static_cast<std::uint32_t>(getuid());
    options.gid = static_cast<std::uint32_t>(getgid());
  }

  return R::success(std::unique_ptr<SftpTestServer>(
      new SftpTestServer(std::move(options), std::move(key.value()), std::move(runner))));
}

SftpTestServer::SftpTestServer(SftpServerOptions options, std::string public_key,
                               std::shared_ptr<IDockerRunner> runner)
    : options_(std::move(options)), public_key_(std::move(public_key)),
      runner_(std::move(runner)) {}

SftpTestServer::~SftpTestServer() {
  bool started = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    started = started_;
  }
  if (!started) {
    return;
  }
  if (auto status = stop(); !status.ok()) {
    std::cerr << "[sftp-server] cleanup of " << options_.container_name
              << " failed: " << status.error() << "\n";
  }
}

std::string SftpTestServer::name() const { return "sftp-server:" + options_.container_name; }

std::vector<std::string> SftpTestServer::run_args() const {
  const std::string volume_source =
      options_.local_path.has_value() ? options_.local_path->string() : *options_.volume_name;
  return {"run",
          "-d",
          "--name",
          options_.container_name,
          "-e",
          "PUBLIC_KEY=" + public_key_,
          "-e",
          "SUDO_ACCESS=true",
          "-e",
          "PASSWORD_ACCESS=false",
          "-e",
          "USER_NAME=" + options_.user,
          "-e",
          "PUID=" + std::to_string(options_.uid),
          "-e",
          "PGID=" + std::to_string(options_.gid),
          "-p",
          std::to_string(options_.host_port) + ":" + std::to_string(kSftpServerPort) + "/tcp",
          "-v",
          volume_source + ":" + options_.remote_path.value_or(volume_source) + ":rw",
          options_.image};
}

common::Result<std::string> SftpTestServer::inspect(const std::string &format) {
  auto result = runner_->run({"inspect", "--format", format, options_.container_name},
                             DockerCommandOptions{.allow_failure = true});
  if (!result.ok()) {
    return common::Result<std::string>::failure(result.status());
  }
  if (result.value().exit_code != 0) {
    return common::Result<std::string>::failure(common::ErrorCode::Io,
                                                "container " + options_.container_name +
                                                    " not found: " +
                                                    common::trim(result.value().stderr_text));
  }
  return common::Result<std::string>::success(common::trim(result.value().stdout_text));
}

bool SftpTestServer::is_running() {
  auto status = inspect("{{.State.Status}}");
  return status.ok() && status.value() == "running";
}

common::Status SftpTestServer::remove_container() {
  const DockerCommandOptions tolerant{.allow_failure = true};
  for (int attempt = 0; attempt < options_.remove_retries; ++attempt) {
    auto killed = runner_->run({"kill", options_.container_name}, tolerant);
    if (!killed.ok()) {
      return killed.status();
    }
    auto removed = runner_->run({"rm", "-f", options_.container_name}, tolerant);
    if (!removed.ok()) {
      return removed.status();
    }
    auto exists = runner_->run({"inspect", options_.container_name}, tolerant);
    if (!exists.ok()) {
      return exists.status();
    }
    if (exists.value().exit_code != 0) {
      return common::Status::success();
    }
    if (attempt + 1 < options_.remove_retries) {
      std::this_thread::sleep_for(options_.retry_delay);
    }
  }
  return common::Status::error(common::ErrorCode::Io,
                               "unable to remove container " + options_.container_name);
}

common::Status SftpTestServer::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_ && is_running()) {
    return common::Status::success();
  }

  if (auto status = remove_container(); !status.ok()) {
    observability::record_error("sftp-server", status.error());
    return status;
  }

  std::cerr << "[sftp-server] starting " << options_.container_name << " from "
            << options_.image << "\n";
  auto ran = runner_->run(run_args());
  if (!ran.ok()) {
    observability::record_error("sftp-server", ran.error());
    return common::Status::error(common::ErrorCode::Launch,
                                 "failed to start sftp server: " + ran.error());
  }
  started_ = true;

  for (int attempt = 0; attempt < options_.start_retries; ++attempt) {
    if (is_running()) {
      std::cerr << "[sftp-server] " << options_.container_name << " is running\n";
      return common::Status::success();
    }
    if (attempt + 1 < options_.start_retries) {
      std::this_thread::sleep_for(options_.retry_delay);
    }
  }

  const std::string message =
      "sftp server " + options_.container_name + " did not reach running state";
  observability::record_error("sftp-server", message);
  if (auto cleanup = remove_container(); !cleanup.ok()) {
    std::cerr << "[sftp-server] cleanup after failed start: " << cleanup.error() << "\n";
  } else {
    started_ = false;
  }
  return common::Status::error(common::ErrorCode::ReadinessTimeout, message);
}

resource::ResourceStatus SftpTestServer::probe() {
  std::lock_guard<std::mutex> lock(mutex_);
  resource::ResourceStatus out;
  auto status = inspect("{{.State.Status}}");
  if (!status.ok()) {
    out.state = "missing";
    out.detail = status.error();
    return out;
  }
  out.state = status.value();
  out.healthy = out.state == "running";
  return out;
}

common::Status SftpTestServer::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = remove_container();
  if (status.ok()) {
    started_ = false;
    std::cerr << "[sftp-server] removed " << options_.container_name << "\n";
  }
  return status;
}

common::Result<std::string> SftpTestServer::ip_address() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto address = inspect("{{.NetworkSettings.IPAddress}}");
  if (!address.ok()) {
    return address;
  }
  if (address.value().empty()) {
    return common::Result<std::string>::failure(
        common::ErrorCode::Io, "container " + options_.container_name + " has no ip address");
  }
  return address;
}

common::Result<std::string> SftpTestServer::ssh_command() {
  auto address = ip_address();
  if (!address.ok()) {
    return address;
  }
  return common::Result<std::string>::success(
      "ssh -p " + std::to_string(kSftpServerPort) + " -o StrictHostKeyChecking=no " +
      options_.user + "@" + address.value());
}

} // namespace rmount::server
