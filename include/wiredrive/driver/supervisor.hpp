#pragma once

#include "wiredrive/common/result.hpp"
#include "wiredrive/config/schema.hpp"
#include "wiredrive/driver/process.hpp"
#include "wiredrive/driver/profile.hpp"
#include "wiredrive/observability/observer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wiredrive::driver {

enum class DriverState {
  Idle,
  Starting,
  Running,
  Stopping,
};

[[nodiscard]] std::string_view driver_state_name(DriverState state);

/// What a driver kind contributes to a launch.
struct LaunchPlan {
  std::vector<std::string> args;
  std::string base_url;
  std::optional<Profile> profile;
};

/// Owns one driver process from port selection to shutdown.
///
/// start() and stop() are not reentrant and must not race each other; the
/// owner serializes them.
class DriverSupervisor {
public:
  explicit DriverSupervisor(config::DriverConfig config,
                            std::shared_ptr<observability::IObserver> observer = nullptr);
  ~DriverSupervisor();

  DriverSupervisor(const DriverSupervisor &) = delete;
  DriverSupervisor &operator=(const DriverSupervisor &) = delete;

  /// Errors carry the "driver start failed: " prefix.
  [[nodiscard]] common::Status start();

  /// Best effort: signal and close failures go to the observer, the state
  /// always ends Idle.
  [[nodiscard]] common::Status stop();

  [[nodiscard]] DriverState state() const { return state_; }
  [[nodiscard]] bool is_running() const { return state_ == DriverState::Running; }
  [[nodiscard]] std::uint16_t port() const { return port_; }
  [[nodiscard]] const std::string &base_url() const { return base_url_; }
  [[nodiscard]] std::optional<std::filesystem::path> profile_directory() const;
  [[nodiscard]] std::optional<pid_t> pid() const;
  [[nodiscard]] const config::DriverConfig &config() const { return config_; }

private:
  [[nodiscard]] common::Result<LaunchPlan> prepare(std::uint16_t port) const;
  [[nodiscard]] common::Status transition(DriverState from, DriverState to);
  void abort_start();
  void shutdown_process(bool &forced);
  void discard_profile();
  void report_error(const std::string &message);

  config::DriverConfig config_;
  std::shared_ptr<observability::IObserver> observer_;
  DriverState state_ = DriverState::Idle;
  std::uint16_t port_ = 0;
  std::string base_url_;
  std::unique_ptr<ChildProcess> process_;
  std::optional<Profile> profile_;
};

/// Arguments of the standalone driver binary.
[[nodiscard]] std::vector<std::string> standalone_arguments(const config::StandaloneDriver &driver,
                                                            std::uint16_t port);

} // namespace wiredrive::driver
