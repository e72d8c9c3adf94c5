#include "test_helpers.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/observability/global.hpp"
#include "rmount/observability/observers.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>

namespace rmount::testing {

namespace {

constexpr const char *kFakeMountScript = R"SH(#!/bin/sh
table="$1"
mountpoint="$2"
mode="$3"
log="$4"
echo "$$" >> "$log"
register() {
  echo "36 25 0:99 / $mountpoint rw,nosuid,nodev - fuse.fake fake rw" >> "$table"
}
unregister() {
  grep -F -v " $mountpoint " "$table" > "$table.tmp.$$"
  mv "$table.tmp.$$" "$table"
}
case "$mode" in
  exit)
    echo "Fatal error: remote unreachable" >&2
    exit 3
    ;;
  silent)
    echo "starting"
    ;;
  flaky)
    register
    echo "mount ready"
    sleep 1
    unregister
    exit 4
    ;;
  once)
    if [ "$(wc -l < "$log")" -gt 1 ]; then
      echo "Fatal error: remote unreachable" >&2
      exit 3
    fi
    register
    echo "mount ready"
    sleep 1
    unregister
    exit 4
    ;;
  stubborn)
    trap '' TERM
    register
    echo "mount ready"
    ;;
  *)
    trap 'unregister; exit 0' TERM INT
    register
    echo "mount ready"
    ;;
esac
while true; do
  sleep 0.05
done
)SH";

constexpr const char *kUnmountScript = R"(#!/bin/sh
table="$1"
mountpoint="$2"
grep -F -v " $mountpoint " "$table" > "$table.tmp.$$"
mv "$table.tmp.$$" "$table"
)";

} // namespace

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = common::normalize_mountpoint(std::filesystem::temp_directory_path() /
                                       ("rmount-test-workspace-" + std::to_string(rng())));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::filesystem::path TempWorkspace::create_script(const std::string &name,
                                                   const std::string &body) const {
  create_file(name, body);
  const auto script = path_ / name;
  if (chmod(script.c_str(), 0755) != 0) {
    throw std::runtime_error("chmod failed for " + script.string());
  }
  return script;
}

std::filesystem::path TempWorkspace::create_dir(const std::string &name) const {
  const auto dir = path_ / name;
  std::filesystem::create_directories(dir);
  return dir;
}

std::string mountinfo_line(const std::filesystem::path &mountpoint) {
  return "36 25 0:99 / " + mountpoint.string() + " rw,nosuid,nodev - fuse.fake fake rw\n";
}

FakeMountTable::FakeMountTable(const TempWorkspace &workspace)
    : path_(workspace.path() / "mountinfo") {
  // A real root entry keeps the table in mountinfo shape.
  std::ofstream out(path_, std::ios::trunc);
  out << "22 1 8:1 / / rw,relatime - ext4 /dev/sda1 rw\n";
}

void FakeMountTable::add(const std::filesystem::path &mountpoint) const {
  std::ofstream out(path_, std::ios::app);
  out << mountinfo_line(mountpoint);
}

void FakeMountTable::remove(const std::filesystem::path &mountpoint) const {
  std::ifstream in(path_);
  std::string kept;
  std::string line;
  const std::string needle = " " + mountpoint.string() + " ";
  while (std::getline(in, line)) {
    if (line.find(needle) == std::string::npos) {
      kept += line + "\n";
    }
  }
  in.close();
  std::ofstream out(path_, std::ios::trunc);
  out << kept;
}

bool FakeMountTable::contains(const std::filesystem::path &mountpoint) const {
  std::ifstream in(path_);
  std::string line;
  const std::string needle = " " + mountpoint.string() + " ";
  while (std::getline(in, line)) {
    if (line.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

MountFixture::MountFixture(const TempWorkspace &workspace_)
    : workspace(workspace_), table(workspace_), mountpoint(workspace_.create_dir("mnt")),
      mount_script(workspace_.create_script("fake_mount.sh", kFakeMountScript)),
      unmount_script(workspace_.create_script("fake_unmount.sh", kUnmountScript)),
      spawn_log(workspace_.path() / "spawns.log") {}

std::shared_ptr<const mount::MountSpec> MountFixture::spec(const std::string &mode) const {
  mount::MountSpec spec;
  spec.executable = mount_script.string();
  spec.args = {table.path().string(), mountpoint.string(), mode, spawn_log.string()};
  spec.mountpoint = mountpoint;
  auto made = mount::make_mount_spec(std::move(spec));
  return made.value();
}

supervisor::SupervisorOptions MountFixture::options() const {
  supervisor::SupervisorOptions options;
  options.poll_interval = std::chrono::milliseconds(100);
  options.startup_timeout = std::chrono::milliseconds(2'000);
  options.shutdown_grace = std::chrono::milliseconds(500);
  options.probe_timeout = std::chrono::milliseconds(1'000);
  options.startup_probe_delay = std::chrono::milliseconds(20);
  options.mount_table = table.path().string();
  options.restart.max_attempts = 3;
  options.restart.initial_backoff = std::chrono::milliseconds(50);
  options.restart.max_backoff = std::chrono::milliseconds(200);
  options.restart.multiplier = 2.0;
  options.unmount.command = {unmount_script.string(), table.path().string()};
  options.unmount.attempts = 3;
  options.unmount.retry_delay = std::chrono::milliseconds(50);
  options.unmount.probe_timeout = std::chrono::milliseconds(1'000);
  return options;
}

std::size_t count_lines(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::size_t lines = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      ++lines;
    }
  }
  return lines;
}

bool wait_until(const std::function<bool()> &condition, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ObserverGuard::ObserverGuard() {
  observability::set_global_observer(std::make_unique<RecordingObserver>());
  observer_ = std::dynamic_pointer_cast<RecordingObserver>(observability::get_global_observer());
}

ObserverGuard::~ObserverGuard() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

common::Result<server::DockerProcessResult>
FakeDockerRunner::run(const std::vector<std::string> &args, const server::DockerCommandOptions &) {
  Handler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(args);
    handler = handler_;
  }
  if (!handler) {
    return docker_ok();
  }
  return handler(args);
}

void FakeDockerRunner::set_handler(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

std::vector<std::vector<std::string>> FakeDockerRunner::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

std::size_t FakeDockerRunner::count(const std::string &subcommand) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto &call : calls_) {
    if (!call.empty() && call.front() == subcommand) {
      ++total;
    }
  }
  return total;
}

common::Result<server::DockerProcessResult> docker_ok(std::string stdout_text) {
  server::DockerProcessResult result;
  result.stdout_text = std::move(stdout_text);
  return common::Result<server::DockerProcessResult>::success(std::move(result));
}

common::Result<server::DockerProcessResult> docker_exit(const int code, std::string stderr_text) {
  server::DockerProcessResult result;
  result.exit_code = code;
  result.stderr_text = std::move(stderr_text);
  return common::Result<server::DockerProcessResult>::success(std::move(result));
}

} // namespace rmount::testing
