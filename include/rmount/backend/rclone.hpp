#pragma once

#include "rmount/common/result.hpp"
#include "rmount/config/schema.hpp"
#include "rmount/mount/heartbeat.hpp"
#include "rmount/mount/mount_spec.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rmount::backend {

/// Ordered `key = value` lines of one rclone remote section.
using RemoteSettings = std::vector<std::pair<std::string, std::string>>;

inline constexpr const char *kRemoteName = "rmount";

struct S3Backend {
  std::string provider;
  std::string access_key_id;
  std::string secret_access_key;
  std::string region;
  std::string endpoint;
  /// Take credentials from the environment; the key fields must stay empty.
  bool env_auth = false;
  /// Only used when rclone creates buckets.
  std::string location_constraint;
  std::string acl = "private";
  std::string server_side_encryption;
  std::string storage_class;

  [[nodiscard]] common::Result<RemoteSettings> to_settings() const;
};

struct SftpBackend {
  std::string host;
  std::string user;
  std::uint16_t port = 22;
  std::optional<std::string> key_pem;
  std::optional<std::filesystem::path> key_file;
  bool key_use_agent = false;

  /// Exactly one of `key_pem` and `key_file` must be set. Key newlines are
  /// written as the two characters `\n`, which rclone expands.
  [[nodiscard]] common::Result<RemoteSettings> to_settings() const;
};

[[nodiscard]] std::string render_rclone_config(const RemoteSettings &settings,
                                               const std::string &remote_name = kRemoteName);

/// An rclone config file readable only by the owner, removed on destruction.
class RcloneConfigFile {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<RcloneConfigFile>>
  write(const RemoteSettings &settings, const std::filesystem::path &directory);

  ~RcloneConfigFile();
  RcloneConfigFile(const RcloneConfigFile &) = delete;
  RcloneConfigFile &operator=(const RcloneConfigFile &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  explicit RcloneConfigFile(std::filesystem::path path) : path_(std::move(path)) {}

  std::filesystem::path path_;
};

struct RcloneMountOptions {
  std::string binary = "rclone";
  std::uint64_t refresh_interval_seconds = 10;
  std::string remote_name = kRemoteName;
  std::vector<std::string> extra_args;
};

[[nodiscard]] RcloneMountOptions rclone_options_from_config(const config::RcloneConfig &config);

/// Spec for `rclone mount --config CONFIG REMOTE:PATH LOCAL ...` with write
/// caching and a failure pattern for rclone's fatal log lines.
[[nodiscard]] common::Result<std::shared_ptr<const mount::MountSpec>>
make_rclone_mount_spec(const std::filesystem::path &config_path, const std::string &remote_path,
                       const std::filesystem::path &local_path,
                       const RcloneMountOptions &options = {});

/// Writer that uploads the heartbeat with
/// `rclone copyto TMP REMOTE:PATH/.rmount --config CONFIG`, bypassing the
/// mount so the read back through it proves the remote round trip.
[[nodiscard]] mount::HeartbeatWriter
make_rclone_heartbeat_writer(const std::filesystem::path &config_path,
                             const std::string &remote_path,
                             const RcloneMountOptions &options = {},
                             std::chrono::milliseconds timeout = std::chrono::seconds(30));

/// Refresh every `refresh_interval_seconds`, stale after three missed refreshes.
[[nodiscard]] mount::HeartbeatOptions rclone_heartbeat_options(const RcloneMountOptions &options);

} // namespace rmount::backend
