#pragma once

#include "rmount/common/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace rmount::server {

struct DockerCommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{60'000};
};

struct DockerProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  /// Runs `docker <args...>`.
  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

class DockerCliRunner final : public IDockerRunner {
public:
  explicit DockerCliRunner(std::string binary = "docker") : binary_(std::move(binary)) {}

  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;

private:
  std::string binary_;
};

} // namespace rmount::server
