#include "rmount/backend/rclone.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/common/random.hpp"
#include "rmount/process/command.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace rmount::backend {

namespace {

std::string escape_newlines(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    if (ch == '\n') {
      out += "\\n";
    } else if (ch != '\r') {
      out.push_back(ch);
    }
  }
  return out;
}

std::string bool_setting(const bool value) { return value ? "true" : "false"; }

common::Status check_setting_value(const std::string &key, const std::string &value) {
  if (value.find('\n') != std::string::npos) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "setting '" + key + "' must not contain a newline");
  }
  return common::Status::success();
}

} // namespace

common::Result<RemoteSettings> S3Backend::to_settings() const {
  if (common::trim(provider).empty()) {
    return common::Result<RemoteSettings>::failure(common::ErrorCode::InvalidArgument,
                                                   "s3 provider must not be empty");
  }
  if (env_auth && (!access_key_id.empty() || !secret_access_key.empty())) {
    return common::Result<RemoteSettings>::failure(
        common::ErrorCode::InvalidArgument,
        "access_key_id and secret_access_key must be empty when env_auth is set");
  }

  RemoteSettings settings = {
      {"provider", provider},
      {"access_key_id", access_key_id},
      {"secret_access_key", secret_access_key},
      {"region", region},
      {"endpoint", endpoint},
      {"env_auth", bool_setting(env_auth)},
      {"location_constraint", location_constraint},
      {"acl", acl},
      {"server_side_encryption", server_side_encryption},
      {"storage_class", storage_class},
      {"type", "s3"},
  };
  for (const auto &[key, value] : settings) {
    if (auto status = check_setting_value(key, value); !status.ok()) {
      return common::Result<RemoteSettings>::failure(status);
    }
  }
  return common::Result<RemoteSettings>::success(std::move(settings));
}

common::Result<RemoteSettings> SftpBackend::to_settings() const {
  if (key_pem.has_value() == key_file.has_value()) {
    return common::Result<RemoteSettings>::failure(
        common::ErrorCode::InvalidArgument, "must provide exactly one of key_pem or key_file");
  }
  if (common::trim(host).empty() || common::trim(user).empty()) {
    return common::Result<RemoteSettings>::failure(common::ErrorCode::InvalidArgument,
                                                   "sftp host and user must not be empty");
  }
  if (port == 0) {
    return common::Result<RemoteSettings>::failure(common::ErrorCode::InvalidArgument,
                                                   "sftp port must not be 0");
  }

  std::string key;
  if (key_file.has_value()) {
    std::ifstream file(*key_file);
    if (!file) {
      return common::Result<RemoteSettings>::failure(
          common::ErrorCode::Io, "unable to read key file " + key_file->string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    key = buffer.str();
  } else {
    key = *key_pem;
  }

  RemoteSettings settings = {
      {"host", host},
      {"user", user},
      {"port", std::to_string(port)},
      {"key_pem", escape_newlines(key)},
      {"key_use_agent", bool_setting(key_use_agent)},
      {"type", "sftp"},
  };
  for (const auto &[name, value] : settings) {
    if (auto status = check_setting_value(name, value); !status.ok()) {
      return common::Result<RemoteSettings>::failure(status);
    }
  }
  return common::Result<RemoteSettings>::success(std::move(settings));
}

std::string render_rclone_config(const RemoteSettings &settings, const std::string &remote_name) {
  std::ostringstream out;
  out << "[" << remote_name << "]\n";
  for (const auto &[key, value] : settings) {
    out << key << " = " << value << "\n";
  }
  return out.str();
}

common::Result<std::unique_ptr<RcloneConfigFile>>
RcloneConfigFile::write(const RemoteSettings &settings, const std::filesystem::path &directory) {
  auto dir = common::ensure_dir(directory);
  if (!dir.ok()) {
    return common::Result<std::unique_ptr<RcloneConfigFile>>::failure(dir.status());
  }

  std::string name;
  try {
    name = "rmount-" + common::random_uuid() + ".conf";
  } catch (const std::runtime_error &err) {
    return common::Result<std::unique_ptr<RcloneConfigFile>>::failure(common::ErrorCode::Internal,
                                                                      err.what());
  }
  const auto path = dir.value() / name;

  // Created owner-only before any secret is written.
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    return common::Result<std::unique_ptr<RcloneConfigFile>>::failure(
        common::ErrorCode::Io, "unable to create " + path.string() + ": " + std::strerror(errno));
  }
  close(fd);
  std::unique_ptr<RcloneConfigFile> file(new RcloneConfigFile(path));

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return common::Result<std::unique_ptr<RcloneConfigFile>>::failure(
        common::ErrorCode::Io, "unable to write " + path.string());
  }
  out << render_rclone_config(settings);
  out.close();
  if (!out) {
    return common::Result<std::unique_ptr<RcloneConfigFile>>::failure(
        common::ErrorCode::Io, "failed writing " + path.string());
  }
  return common::Result<std::unique_ptr<RcloneConfigFile>>::success(std::move(file));
}

RcloneConfigFile::~RcloneConfigFile() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    std::cerr << "[rclone] failed to remove " << path_.string() << ": " << ec.message() << "\n";
  }
}

RcloneMountOptions rclone_options_from_config(const config::RcloneConfig &config) {
  RcloneMountOptions options;
  options.binary = config.binary;
  options.refresh_interval_seconds = config.refresh_interval_seconds;
  return options;
}

common::Result<std::shared_ptr<const mount::MountSpec>>
make_rclone_mount_spec(const std::filesystem::path &config_path, const std::string &remote_path,
                       const std::filesystem::path &local_path,
                       const RcloneMountOptions &options) {
  if (options.refresh_interval_seconds == 0) {
    return common::Result<std::shared_ptr<const mount::MountSpec>>::failure(
        common::ErrorCode::InvalidArgument, "refresh interval must be positive");
  }
  const std::string interval = std::to_string(options.refresh_interval_seconds) + "s";

  mount::MountSpec spec;
  spec.executable = options.binary;
  spec.args = {"mount",
               "--config",
               config_path.string(),
               options.remote_name + ":" + remote_path,
               common::normalize_mountpoint(local_path).string(),
               "--vfs-cache-mode",
               "writes",
               "--allow-non-empty",
               "--poll-interval",
               interval,
               "--vfs-cache-poll-interval",
               interval,
               "--dir-cache-time",
               interval,
               "-v"};
  spec.args.insert(spec.args.end(), options.extra_args.begin(), options.extra_args.end());
  spec.mountpoint = local_path;
  spec.failure_pattern = R"((CRITICAL|Fatal error|mount helper error))";
  return mount::make_mount_spec(std::move(spec));
}

mount::HeartbeatWriter make_rclone_heartbeat_writer(const std::filesystem::path &config_path,
                                                   const std::string &remote_path,
                                                   const RcloneMountOptions &options,
                                                   const std::chrono::milliseconds timeout) {
  std::string target = options.remote_name + ":" + remote_path;
  if (!remote_path.empty() && remote_path.back() != '/') {
    target += "/";
  }
  target += mount::kHeartbeatFile;

  return [config_path, target, binary = options.binary,
          timeout](const std::string &timestamp) -> common::Status {
    std::filesystem::path staging;
    try {
      staging = config_path.parent_path() / ("rmount-heartbeat-" + common::random_uuid());
    } catch (const std::runtime_error &err) {
      return common::Status::error(common::ErrorCode::Internal, err.what());
    }
    {
      std::ofstream out(staging, std::ios::trunc);
      out << timestamp;
      out.close();
      if (!out) {
        return common::Status::error(common::ErrorCode::Io,
                                     "unable to write " + staging.string());
      }
    }

    process::CommandOptions command;
    command.timeout = timeout;
    const auto copied = process::run_command(
        {binary, "copyto", staging.string(), target, "--config", config_path.string()}, command);

    std::error_code ec;
    std::filesystem::remove(staging, ec);
    if (ec) {
      std::cerr << "[rclone] failed to remove " << staging.string() << ": " << ec.message()
                << "\n";
    }
    if (!copied.ok()) {
      return common::Status::error(copied.code(), "heartbeat upload failed: " + copied.error());
    }
    return common::Status::success();
  };
}

mount::HeartbeatOptions rclone_heartbeat_options(const RcloneMountOptions &options) {
  mount::HeartbeatOptions heartbeat;
  heartbeat.refresh_interval = std::chrono::seconds(options.refresh_interval_seconds);
  heartbeat.max_age = 3 * heartbeat.refresh_interval;
  return heartbeat;
}

} // namespace rmount::backend
