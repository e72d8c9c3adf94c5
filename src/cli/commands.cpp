#include "rmount/cli/commands.hpp"

#include "rmount/backend/rclone.hpp"
#include "rmount/common/fs.hpp"
#include "rmount/config/config.hpp"
#include "rmount/mount/heartbeat.hpp"
#include "rmount/mount/mount_spec.hpp"
#include "rmount/mount/probe.hpp"
#include "rmount/observability/factory.hpp"
#include "rmount/observability/global.hpp"
#include "rmount/supervisor/registry.hpp"
#include "rmount/supervisor/shutdown_hook.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace rmount::cli {

namespace {

std::string version_string() {
#ifdef RMOUNT_VERSION
  std::string version = RMOUNT_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "rmount " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated(std::vector<std::string> &args,
                                       const std::string &long_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool reject_leftovers(const std::vector<std::string> &args, const std::string &usage) {
  if (args.empty()) {
    return false;
  }
  std::cerr << "unexpected argument: " << args.front() << "\n" << usage;
  return true;
}

common::Result<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<config::Config>::failure(warnings.status());
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }
  return cfg;
}

/// Mounts `spec` and blocks until a termination signal arrives or the
/// supervisor gives up, then releases the mountpoint. A null `probe` checks
/// the mount table only.
int supervise(const config::Config &cfg, std::shared_ptr<const mount::MountSpec> spec,
              std::shared_ptr<mount::IMountProbe> probe = nullptr) {
  observability::set_global_observer(observability::create_observer(cfg));

  auto registry = std::make_shared<supervisor::MountRegistry>();
  auto created = registry->create_supervisor(
      std::move(spec), supervisor::supervisor_options_from_config(cfg), std::move(probe));
  if (!created.ok()) {
    std::cerr << created.error() << "\n";
    return 1;
  }
  auto mount = created.value();

  supervisor::ShutdownHookOptions hook_options;
  hook_options.reraise = false;
  supervisor::ShutdownHook hook(registry, hook_options);
  if (auto status = hook.install(); !status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }

  std::cerr << "[rmount] mounting " << mount->spec().describe() << "\n";
  if (auto status = mount->mount(); !status.ok()) {
    std::cerr << "mount failed (" << common::error_code_name(status.code())
              << "): " << status.error() << "\n";
    for (const auto &line : mount->recent_output(20)) {
      std::cerr << "  | " << line << "\n";
    }
    if (auto released = registry->unmount_all(); !released.ok()) {
      std::cerr << "cleanup failed: " << released.error() << "\n";
    }
    return 1;
  }
  std::cout << "mounted " << mount->spec().mountpoint.string() << " (Ctrl-C to unmount)\n";

  bool failed = false;
  while (!hook.wait(std::chrono::milliseconds(500))) {
    if (mount->state() == supervisor::SupervisorState::Failed) {
      failed = true;
      break;
    }
  }
  if (failed) {
    const auto snapshot = mount->snapshot();
    std::cerr << "mount failed: " << snapshot.last_error << "\n";
  }

  // No-op when the signal watcher has already released everything.
  if (auto status = registry->unmount_all(); !status.ok()) {
    std::cerr << "unmount failed: " << status.error() << "\n";
    return 1;
  }
  if (hook.triggered()) {
    std::cout << "unmounted after signal " << hook.last_signal() << "\n";
  }
  return failed ? 1 : 0;
}

std::filesystem::path rclone_config_directory(const config::Config &cfg) {
  if (!cfg.rclone.config_dir.empty()) {
    return common::expand_path(cfg.rclone.config_dir);
  }
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);
  return ec ? std::filesystem::path("/tmp") : dir;
}

int supervise_rclone(const config::Config &cfg, const backend::RemoteSettings &settings,
                     const std::string &remote_path, const std::string &mountpoint) {
  auto file = backend::RcloneConfigFile::write(settings, rclone_config_directory(cfg));
  if (!file.ok()) {
    std::cerr << file.error() << "\n";
    return 1;
  }
  const auto options = backend::rclone_options_from_config(cfg.rclone);
  auto spec =
      backend::make_rclone_mount_spec(file.value()->path(), remote_path, mountpoint, options);
  if (!spec.ok()) {
    std::cerr << spec.error() << "\n";
    return 1;
  }
  if (!cfg.rclone.heartbeat) {
    return supervise(cfg, spec.value());
  }

  const auto supervision = supervisor::supervisor_options_from_config(cfg);
  auto probe = std::make_shared<mount::HeartbeatProbe>(
      std::make_shared<mount::MountTableProbe>(supervision.mount_table),
      backend::make_rclone_heartbeat_writer(file.value()->path(), remote_path, options,
                                            supervision.probe_timeout),
      backend::rclone_heartbeat_options(options));
  return supervise(cfg, spec.value(), std::move(probe));
}

constexpr const char *MOUNT_USAGE =
    "usage: rmount mount --mountpoint DIR [--env K=V]... [--ready REGEX] [--fail REGEX] "
    "-- EXECUTABLE [ARGS...]\n";

int run_mount(std::vector<std::string> args) {
  std::vector<std::string> command;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      command.assign(args.begin() + static_cast<long>(i + 1), args.end());
      args.erase(args.begin() + static_cast<long>(i), args.end());
      break;
    }
  }

  mount::MountSpec spec;
  std::string mountpoint;
  if (!take_option(args, "--mountpoint", mountpoint) || command.empty()) {
    std::cerr << MOUNT_USAGE;
    return 1;
  }
  for (const auto &assignment : take_repeated(args, "--env")) {
    auto pair = common::split_assignment(assignment);
    if (!pair.has_value()) {
      std::cerr << "invalid --env value (expected K=V): " << assignment << "\n";
      return 1;
    }
    spec.env[pair->first] = pair->second;
  }
  (void)take_option(args, "--ready", spec.readiness_pattern);
  (void)take_option(args, "--fail", spec.failure_pattern);
  if (reject_leftovers(args, MOUNT_USAGE)) {
    return 1;
  }

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  spec.executable = command.front();
  spec.args.assign(command.begin() + 1, command.end());
  spec.mountpoint = common::expand_path(mountpoint);
  auto made = mount::make_mount_spec(std::move(spec));
  if (!made.ok()) {
    std::cerr << made.error() << "\n";
    return 1;
  }
  return supervise(cfg.value(), made.value());
}

constexpr const char *S3_USAGE =
    "usage: rmount s3 --provider NAME --remote-path BUCKET/PATH --mountpoint DIR\n"
    "                 [--access-key-id ID --secret-access-key KEY | --env-auth]\n"
    "                 [--region R] [--endpoint URL] [--storage-class C]\n";

int run_s3(std::vector<std::string> args) {
  backend::S3Backend s3;
  std::string remote_path;
  std::string mountpoint;
  if (!take_option(args, "--provider", s3.provider) ||
      !take_option(args, "--remote-path", remote_path) ||
      !take_option(args, "--mountpoint", mountpoint)) {
    std::cerr << S3_USAGE;
    return 1;
  }
  (void)take_option(args, "--access-key-id", s3.access_key_id);
  (void)take_option(args, "--secret-access-key", s3.secret_access_key);
  (void)take_option(args, "--region", s3.region);
  (void)take_option(args, "--endpoint", s3.endpoint);
  (void)take_option(args, "--storage-class", s3.storage_class);
  (void)take_option(args, "--server-side-encryption", s3.server_side_encryption);
  s3.env_auth = take_flag(args, "--env-auth");
  if (reject_leftovers(args, S3_USAGE)) {
    return 1;
  }

  auto settings = s3.to_settings();
  if (!settings.ok()) {
    std::cerr << settings.error() << "\n";
    return 1;
  }
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  return supervise_rclone(cfg.value(), settings.value(), remote_path,
                          common::expand_path(mountpoint));
}

constexpr const char *SFTP_USAGE =
    "usage: rmount sftp --host HOST --user USER (--key-file PATH | --key-pem PEM)\n"
    "                   --remote-path PATH --mountpoint DIR [--port N] [--key-use-agent]\n";

int run_sftp(std::vector<std::string> args) {
  backend::SftpBackend sftp;
  std::string remote_path;
  std::string mountpoint;
  if (!take_option(args, "--host", sftp.host) || !take_option(args, "--user", sftp.user) ||
      !take_option(args, "--remote-path", remote_path) ||
      !take_option(args, "--mountpoint", mountpoint)) {
    std::cerr << SFTP_USAGE;
    return 1;
  }
  std::string value;
  if (take_option(args, "--port", value)) {
    try {
      const unsigned long port = std::stoul(value);
      if (port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        std::cerr << "invalid port: " << value << "\n";
        return 1;
      }
      sftp.port = static_cast<std::uint16_t>(port);
    } catch (const std::exception &) {
      std::cerr << "invalid port: " << value << "\n";
      return 1;
    }
  }
  if (take_option(args, "--key-file", value)) {
    sftp.key_file = common::expand_path(value);
  }
  if (take_option(args, "--key-pem", value)) {
    sftp.key_pem = value;
  }
  sftp.key_use_agent = take_flag(args, "--key-use-agent");
  if (reject_leftovers(args, SFTP_USAGE)) {
    return 1;
  }

  auto settings = sftp.to_settings();
  if (!settings.ok()) {
    std::cerr << settings.error() << "\n";
    return 1;
  }
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  return supervise_rclone(cfg.value(), settings.value(), remote_path,
                          common::expand_path(mountpoint));
}

int run_probe(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: rmount probe PATH\n";
    return 2;
  }
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 2;
  }
  const auto options = supervisor::supervisor_options_from_config(cfg.value());
  auto probe = std::make_shared<mount::MountTableProbe>(options.mount_table);
  const auto outcome = mount::probe_with_timeout(
      probe, common::normalize_mountpoint(common::expand_path(args[0])), options.probe_timeout);
  std::cout << mount::probe_status_name(outcome.status);
  if (!outcome.detail.empty()) {
    std::cout << ": " << outcome.detail;
  }
  std::cout << "\n";
  return outcome.mounted() ? 0 : 1;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string();
    if (!config::config_exists()) {
      std::cout << " (not created, defaults in use)";
    }
    std::cout << "\n";
    return 0;
  }
  if (!args.empty() && args[0] != "show") {
    std::cerr << "usage: rmount config [show|path]\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  std::cout << config::render_config(cfg.value());
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    std::cerr << "invalid: " << warnings.error() << "\n";
    return 1;
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << " - keeps FUSE mount processes alive\n\n";
  std::cout << "usage: rmount [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  mount     Supervise an arbitrary mount command until interrupted\n";
  std::cout << "  s3        Mount an S3 bucket through rclone\n";
  std::cout << "  sftp      Mount an SFTP directory through rclone\n";
  std::cout << "  probe     Report whether a path is a mountpoint\n";
  std::cout << "  config    Show the effective configuration (show|path)\n";
  std::cout << "  version   Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "mount") {
    return run_mount(std::move(args));
  }
  if (subcommand == "s3") {
    return run_s3(std::move(args));
  }
  if (subcommand == "sftp") {
    return run_sftp(std::move(args));
  }
  if (subcommand == "probe") {
    return run_probe(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace rmount::cli
