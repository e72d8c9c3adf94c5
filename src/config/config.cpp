#include "rmount/config/config.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace rmount::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".rmount";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("RMOUNT_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<double> env_double(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(raw, &end);
  if (end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += common::quote_toml_string(values[i]);
  }
  out += "]";
  return out;
}

std::string double_array_to_toml(const std::vector<double> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << values[i];
  }
  out << "]";
  return out.str();
}

/// Reads typed keys into config fields. After the first type error the
/// remaining reads are skipped and the error is kept.
class FieldReader {
public:
  explicit FieldReader(const common::TomlDocument &doc) : doc_(doc) {}

  void number(const std::string &key, double &field) {
    store(field, doc_.read_double(key, field));
  }
  void flag(const std::string &key, bool &field) { store(field, doc_.read_bool(key, field)); }
  void text(const std::string &key, std::string &field) {
    store(field, doc_.read_string(key, field));
  }
  void list(const std::string &key, std::vector<std::string> &field) {
    store(field, doc_.read_string_array(key, field));
  }
  void list(const std::string &key, std::vector<double> &field) {
    store(field, doc_.read_double_array(key, field));
  }

  template <typename Unsigned> void count(const std::string &key, Unsigned &field) {
    if (!status_.ok()) {
      return;
    }
    const auto value = doc_.read_u64(key, field);
    if (!value.ok()) {
      status_ = value.status();
    } else if (value.value() > std::numeric_limits<Unsigned>::max()) {
      status_ = common::Status::error(common::ErrorCode::Config, key + " is out of range");
    } else {
      field = static_cast<Unsigned>(value.value());
    }
  }

  [[nodiscard]] const common::Status &status() const { return status_; }

private:
  template <typename T> void store(T &field, common::Result<T> value) {
    if (!status_.ok()) {
      return;
    }
    if (!value.ok()) {
      status_ = value.status();
      return;
    }
    field = std::move(value.value());
  }

  const common::TomlDocument &doc_;
  common::Status status_ = common::Status::success();
};

void load_supervisor_config(SupervisorConfig &sup, FieldReader &read) {
  read.number("supervisor.poll_interval_seconds", sup.poll_interval_seconds);
  read.number("supervisor.startup_timeout_seconds", sup.startup_timeout_seconds);
  read.number("supervisor.shutdown_grace_seconds", sup.shutdown_grace_seconds);
  read.number("supervisor.probe_timeout_seconds", sup.probe_timeout_seconds);
  read.number("supervisor.freshness_window_seconds", sup.freshness_window_seconds);
  read.count("supervisor.probe_failure_threshold", sup.probe_failure_threshold);
  read.count("supervisor.unmount_attempts", sup.unmount_attempts);
  read.list("supervisor.unmount_command", sup.unmount_command);
  read.text("supervisor.mount_table", sup.mount_table);
  read.count("supervisor.output_buffer_bytes", sup.output_buffer_bytes);
  sup.mount_table = common::expand_path(sup.mount_table);
}

void load_restart_config(RestartConfig &restart, FieldReader &read) {
  read.count("restart.max_attempts", restart.max_attempts);
  read.number("restart.window_seconds", restart.window_seconds);
  read.number("restart.initial_backoff_seconds", restart.initial_backoff_seconds);
  read.number("restart.max_backoff_seconds", restart.max_backoff_seconds);
  read.number("restart.backoff_multiplier", restart.backoff_multiplier);
  read.list("restart.backoff_seconds", restart.backoff_seconds);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Config, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER, std::filesystem::perms::owner_all);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const auto value = env_double("RMOUNT_POLL_INTERVAL_SECONDS"); value.has_value()) {
    config.supervisor.poll_interval_seconds = *value;
  }
  if (const auto value = env_double("RMOUNT_STARTUP_TIMEOUT_SECONDS"); value.has_value()) {
    config.supervisor.startup_timeout_seconds = *value;
  }
  if (const auto value = env_double("RMOUNT_SHUTDOWN_GRACE_SECONDS"); value.has_value()) {
    config.supervisor.shutdown_grace_seconds = *value;
  }
  if (const auto value = env_double("RMOUNT_MAX_RESTARTS"); value.has_value() && *value >= 0) {
    config.restart.max_attempts = static_cast<std::uint32_t>(*value);
  }
  if (const char *backend = std::getenv("RMOUNT_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
  if (const char *rclone = std::getenv("RMOUNT_RCLONE"); rclone != nullptr && *rclone) {
    config.rclone.binary = rclone;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  FieldReader read(doc);
  load_supervisor_config(config.supervisor, read);
  load_restart_config(config.restart, read);
  read.text("observability.backend", config.observability.backend);
  read.flag("observability.verbose", config.observability.verbose);
  read.text("rclone.binary", config.rclone.binary);
  read.count("rclone.refresh_interval_seconds", config.rclone.refresh_interval_seconds);
  read.text("rclone.config_dir", config.rclone.config_dir);
  read.flag("rclone.heartbeat", config.rclone.heartbeat);
  if (!read.status().ok()) {
    return common::Result<Config>::failure(read.status());
  }

  config.rclone.binary = common::expand_path(config.rclone.binary);
  config.rclone.config_dir = common::expand_path(config.rclone.config_dir);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::Config,
                                           "unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Config,
                                           path.string() + ": " + config.error());
  }

  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  const auto &sup = config.supervisor;
  out << "[supervisor]\n";
  out << "poll_interval_seconds = " << sup.poll_interval_seconds << "\n";
  out << "startup_timeout_seconds = " << sup.startup_timeout_seconds << "\n";
  out << "shutdown_grace_seconds = " << sup.shutdown_grace_seconds << "\n";
  out << "probe_timeout_seconds = " << sup.probe_timeout_seconds << "\n";
  out << "freshness_window_seconds = " << sup.freshness_window_seconds << "\n";
  out << "probe_failure_threshold = " << sup.probe_failure_threshold << "\n";
  out << "unmount_attempts = " << sup.unmount_attempts << "\n";
  out << "unmount_command = " << string_array_to_toml(sup.unmount_command) << "\n";
  out << "mount_table = " << common::quote_toml_string(sup.mount_table) << "\n";
  out << "output_buffer_bytes = " << sup.output_buffer_bytes << "\n";

  const auto &restart = config.restart;
  out << "\n[restart]\n";
  out << "max_attempts = " << restart.max_attempts << "\n";
  out << "window_seconds = " << restart.window_seconds << "\n";
  out << "initial_backoff_seconds = " << restart.initial_backoff_seconds << "\n";
  out << "max_backoff_seconds = " << restart.max_backoff_seconds << "\n";
  out << "backoff_multiplier = " << restart.backoff_multiplier << "\n";
  out << "backoff_seconds = " << double_array_to_toml(restart.backoff_seconds) << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "verbose = " << (config.observability.verbose ? "true" : "false") << "\n";

  out << "\n[rclone]\n";
  out << "binary = " << common::quote_toml_string(config.rclone.binary) << "\n";
  out << "refresh_interval_seconds = " << config.rclone.refresh_interval_seconds << "\n";
  out << "config_dir = " << common::quote_toml_string(config.rclone.config_dir) << "\n";
  out << "heartbeat = " << (config.rclone.heartbeat ? "true" : "false") << "\n";
  return out.str();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &sup = config.supervisor;

  if (sup.poll_interval_seconds <= 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "supervisor.poll_interval_seconds must be positive");
  }
  if (sup.startup_timeout_seconds <= 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "supervisor.startup_timeout_seconds must be positive");
  }
  if (sup.shutdown_grace_seconds < 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "supervisor.shutdown_grace_seconds must not be negative");
  }
  if (sup.probe_timeout_seconds <= 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "supervisor.probe_timeout_seconds must be positive");
  }
  if (sup.freshness_window_seconds < 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "supervisor.freshness_window_seconds must not be negative");
  }
  if (sup.unmount_command.empty()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "supervisor.unmount_command must not be empty");
  }
  if (sup.output_buffer_bytes == 0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "supervisor.output_buffer_bytes must be positive");
  }
  if (sup.probe_failure_threshold == 0) {
    warnings.push_back("supervisor.probe_failure_threshold of 0 is treated as 1");
  }
  if (sup.unmount_attempts == 0) {
    warnings.push_back("supervisor.unmount_attempts of 0 disables unmount retries");
  }

  const auto &restart = config.restart;
  if (restart.window_seconds <= 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "restart.window_seconds must be positive");
  }
  if (restart.initial_backoff_seconds < 0.0 || restart.max_backoff_seconds < 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "restart backoff must not be negative");
  }
  if (restart.backoff_multiplier < 1.0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "restart.backoff_multiplier must be at least 1.0");
  }
  for (const double delay : restart.backoff_seconds) {
    if (delay < 0.0) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorCode::Config, "restart.backoff_seconds entries must not be negative");
    }
  }
  if (restart.max_attempts == 0) {
    warnings.push_back("restart.max_attempts is 0: the first failure is terminal");
  }
  if (restart.initial_backoff_seconds > restart.max_backoff_seconds) {
    warnings.push_back("restart.initial_backoff_seconds exceeds restart.max_backoff_seconds");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty()) {
    warnings.push_back("observability.backend is empty, logging is disabled");
  }

  if (config.rclone.refresh_interval_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "rclone.refresh_interval_seconds must be positive");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace rmount::config
