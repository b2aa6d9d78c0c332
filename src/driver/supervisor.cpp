#include "wiredrive/driver/supervisor.hpp"

#include "wiredrive/common/fs.hpp"
#include "wiredrive/driver/port_allocator.hpp"
#include "wiredrive/driver/readiness.hpp"
#include "wiredrive/observability/factory.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <type_traits>

#include <fcntl.h>
#include <unistd.h>

namespace wiredrive::driver {

namespace {

constexpr const char *kStartPrefix = "driver start failed: ";
constexpr const char *kComponent = "driver";
constexpr const char *kFirefoxPortPreference = "webdriver_firefox_port";

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

common::Status check_log_path_writable(const std::string &path) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0664);
  if (fd < 0) {
    return common::Status::error(
        common::config_error("unable to write in log path: " + path + ": " + std::strerror(errno)));
  }
  ::close(fd);
  return common::Status::success();
}

std::string loopback_url(const std::uint16_t port) {
  return "http://127.0.0.1:" + std::to_string(port);
}

} // namespace

std::string_view driver_state_name(const DriverState state) {
  switch (state) {
  case DriverState::Idle:
    return "idle";
  case DriverState::Starting:
    return "starting";
  case DriverState::Running:
    return "running";
  case DriverState::Stopping:
    break;
  }
  return "stopping";
}

std::vector<std::string> standalone_arguments(const config::StandaloneDriver &driver,
                                              const std::uint16_t port) {
  std::vector<std::string> args;
  args.push_back("-port=" + std::to_string(port));
  if (!driver.log_path.empty()) {
    args.push_back("-log-path=" + driver.log_path);
  }
  args.push_back("-http-threads=" + std::to_string(driver.http_threads));
  if (!driver.url_base.empty()) {
    args.push_back("-url-base=" + driver.url_base);
  }
  return args;
}

DriverSupervisor::DriverSupervisor(config::DriverConfig config,
                                   std::shared_ptr<observability::IObserver> observer)
    : config_(std::move(config)), observer_(std::move(observer)) {
  if (observer_ == nullptr) {
    observer_ = observability::noop_observer();
  }
}

DriverSupervisor::~DriverSupervisor() {
  if (state_ == DriverState::Running) {
    if (auto stopped = stop(); !stopped.ok()) {
      report_error(stopped.error().message);
    }
  }
}

std::optional<std::filesystem::path> DriverSupervisor::profile_directory() const {
  if (!profile_.has_value()) {
    return std::nullopt;
  }
  return profile_->directory;
}

std::optional<pid_t> DriverSupervisor::pid() const {
  if (process_ == nullptr || process_->pid() <= 0) {
    return std::nullopt;
  }
  return process_->pid();
}

common::Status DriverSupervisor::transition(const DriverState from, const DriverState to) {
  if (state_ != from) {
    return common::Status::error(common::state_error(
        "invalid transition " + std::string(driver_state_name(state_)) + " -> " +
        std::string(driver_state_name(to))));
  }
  state_ = to;
  return common::Status::success();
}

common::Result<LaunchPlan> DriverSupervisor::prepare(const std::uint16_t port) const {
  return std::visit(
      [&](const auto &driver) -> common::Result<LaunchPlan> {
        using T = std::decay_t<decltype(driver)>;
        LaunchPlan plan;
        if constexpr (std::is_same_v<T, config::StandaloneDriver>) {
          if (!driver.log_path.empty()) {
            if (auto writable = check_log_path_writable(driver.log_path); !writable.ok()) {
              return common::Result<LaunchPlan>::failure(writable.error());
            }
          }
          plan.args = standalone_arguments(driver, port);
          plan.base_url = loopback_url(port) + driver.url_base;
        } else {
          config::Preferences preferences = driver.preferences;
          if (!driver.log_dir.empty()) {
            set_log_directory(preferences, driver.log_dir);
          }
          preferences[kFirefoxPortPreference] = static_cast<std::int64_t>(port);

          auto profile = ProfileBuilder(driver.extension_archive, std::move(preferences)).build();
          if (!profile.ok()) {
            return common::Result<LaunchPlan>::failure(profile.error());
          }
          plan.args = {"-no-remote", "-profile", profile.value().directory.string()};
          plan.base_url = loopback_url(port) + "/hub";
          plan.profile = profile.value();
        }
        return common::Result<LaunchPlan>::success(std::move(plan));
      },
      config_.kind);
}

common::Status DriverSupervisor::start() {
  if (state_ != DriverState::Idle) {
    return common::Status::error(common::state_error("driver already running").with_prefix(kStartPrefix));
  }
  if (auto moved = transition(DriverState::Idle, DriverState::Starting); !moved.ok()) {
    return moved;
  }

  const auto started_at = std::chrono::steady_clock::now();
  const std::string kind = config::driver_kind_name(config_.kind);
  const auto fail = [&](const common::Error &error) {
    state_ = DriverState::Idle;
    observer_->record_event(observability::DriverStartEvent{.kind = kind,
                                                            .binary = config_.binary,
                                                            .port = port_,
                                                            .duration = elapsed_since(started_at),
                                                            .success = false});
    const auto prefixed = error.with_prefix(kStartPrefix);
    report_error(prefixed.message);
    return common::Status::error(prefixed);
  };

  // The lease stays held until start() returns so concurrent starts pick distinct ports.
  auto allocation = allocate_port(config_.port,
                                  PortAllocatorOptions{.base_port = config::default_base_port(config_.kind),
                                                       .lock_timeout = config_.lock_timeout,
                                                       .lock_retry_interval = config_.lock_retry_interval});
  if (!allocation.ok()) {
    return fail(allocation.error());
  }
  port_ = allocation.value().port;

  auto plan = prepare(port_);
  if (!plan.ok()) {
    return fail(plan.error());
  }
  profile_ = plan.value().profile;

  LaunchSpec launch;
  launch.binary = config_.binary;
  launch.args = plan.value().args;
  launch.env = config_.env;
  launch.log_file = config_.log_file;

  auto child = ChildProcess::spawn(launch);
  if (!child.ok()) {
    discard_profile();
    return fail(child.error());
  }
  process_ = std::move(child.value());

  if (auto ready = wait_until_listening(
          port_, ProbeOptions{.timeout = config_.start_timeout, .interval = config_.probe_interval});
      !ready.ok()) {
    abort_start();
    return fail(ready.error());
  }

  base_url_ = plan.value().base_url;
  if (auto moved = transition(DriverState::Starting, DriverState::Running); !moved.ok()) {
    abort_start();
    return fail(moved.error());
  }

  observer_->record_event(observability::DriverStartEvent{.kind = kind,
                                                          .binary = config_.binary,
                                                          .port = port_,
                                                          .duration = elapsed_since(started_at),
                                                          .success = true});
  observer_->record_metric(observability::ActiveDriversMetric{.count = 1});
  return common::Status::success();
}

common::Status DriverSupervisor::stop() {
  if (auto moved = transition(DriverState::Running, DriverState::Stopping); !moved.ok()) {
    return common::Status::error(common::state_error("driver not running"));
  }

  const auto started_at = std::chrono::steady_clock::now();
  bool forced = false;
  shutdown_process(forced);

  if (const auto *extension = std::get_if<config::ExtensionDriver>(&config_.kind);
      extension != nullptr && extension->delete_profile_on_stop) {
    discard_profile();
  } else {
    profile_.reset();
  }

  state_ = DriverState::Idle;
  base_url_.clear();
  observer_->record_event(observability::DriverStopEvent{.kind = config::driver_kind_name(config_.kind),
                                                         .port = port_,
                                                         .duration = elapsed_since(started_at),
                                                         .forced = forced});
  observer_->record_metric(observability::ActiveDriversMetric{.count = 0});
  return common::Status::success();
}

void DriverSupervisor::shutdown_process(bool &forced) {
  if (process_ == nullptr) {
    return;
  }

  if (process_->is_running()) {
    if (auto signalled = process_->signal_group(SIGINT); !signalled.ok()) {
      report_error(signalled.error().message);
    }
    if (!process_->wait_for_exit(config_.stop_grace)) {
      forced = true;
      if (auto killed = process_->kill_and_reap(); !killed.ok()) {
        report_error(killed.error().message);
      }
    }
  }

  if (const auto detached = process_->join_pumps(config_.pump_join_timeout); detached > 0) {
    report_error(std::to_string(detached) + " output pump(s) still running after " +
                 std::to_string(config_.pump_join_timeout.count()) + "ms, detached");
  }

  const auto sink = process_->sink();
  if (auto closed = sink->close(); !closed.ok()) {
    report_error(closed.error().message);
  }
  if (const auto failed = sink->failed_writes(); failed > 0) {
    report_error(std::to_string(failed) + " writes of driver output failed");
  }
  process_.reset();
}

void DriverSupervisor::abort_start() {
  if (process_ != nullptr) {
    if (auto killed = process_->kill_and_reap(); !killed.ok()) {
      report_error(killed.error().message);
    }
    bool forced = true;
    shutdown_process(forced);
  }
  discard_profile();
  base_url_.clear();
}

void DriverSupervisor::discard_profile() {
  if (!profile_.has_value()) {
    return;
  }
  if (auto removed = common::remove_tree(profile_->directory); !removed.ok()) {
    report_error(removed.error().message);
  }
  profile_.reset();
}

void DriverSupervisor::report_error(const std::string &message) {
  observer_->record_event(observability::ErrorEvent{.component = kComponent, .message = message});
}

} // namespace wiredrive::driver
