#pragma once

#include "rmount/common/result.hpp"
#include "rmount/resource/managed_resource.hpp"
#include "rmount/server/docker.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rmount::server {

inline constexpr const char *kSftpServerImage = "lscr.io/linuxserver/openssh-server:latest";
inline constexpr std::uint16_t kSftpServerPort = 2222;

struct SftpServerOptions {
  /// Exactly one of `public_key` and `public_key_file`.
  std::optional<std::string> public_key;
  std::optional<std::filesystem::path> public_key_file;
  std::string user = "admin";
  /// Exactly one of `local_path` (bind mount) and `volume_name`.
  std::optional<std::filesystem::path> local_path;
  std::optional<std::string> volume_name;
  /// Path inside the container; defaults to `local_path`.
  std::optional<std::string> remote_path;
  /// Random when empty.
  std::string container_name;
  std::string image = kSftpServerImage;
  std::uint16_t host_port = kSftpServerPort;
  std::uint32_t uid = 0;
  std::uint32_t gid = 0;
  bool use_current_ids = true;

  int start_retries = 5;
  std::chrono::milliseconds retry_delay{1'000};
  int remove_retries = 10;
};

/// Disposable openssh-server container exposing a directory over SFTP.
class SftpTestServer final : public resource::ManagedResource {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<SftpTestServer>>
  create(SftpServerOptions options, std::shared_ptr<IDockerRunner> runner);

  ~SftpTestServer() override;
  SftpTestServer(const SftpTestServer &) = delete;
  SftpTestServer &operator=(const SftpTestServer &) = delete;

  [[nodiscard]] std::string name() const override;
  [[nodiscard]] common::Status start() override;
  [[nodiscard]] resource::ResourceStatus probe() override;
  [[nodiscard]] common::Status stop() override;

  [[nodiscard]] const std::string &container_name() const { return options_.container_name; }
  [[nodiscard]] const std::string &user() const { return options_.user; }
  [[nodiscard]] std::uint16_t port() const { return kSftpServerPort; }
  [[nodiscard]] common::Result<std::string> ip_address();
  [[nodiscard]] common::Result<std::string> ssh_command();
  [[nodiscard]] std::vector<std::string> run_args() const;

private:
  SftpTestServer(SftpServerOptions options, std::string public_key,
                 std::shared_ptr<IDockerRunner> runner);

  [[nodiscard]] common::Result<std::string> inspect(const std::string &format);
  [[nodiscard]] common::Status remove_container();
  [[nodiscard]] bool is_running();

  SftpServerOptions options_;
  std::string public_key_;
  std::shared_ptr<IDockerRunner> runner_;
  std::mutex mutex_;
  bool started_ = false;
};

} // namespace rmount::server
