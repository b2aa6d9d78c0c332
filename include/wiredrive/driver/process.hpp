#pragma once

#include "wiredrive/common/result.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace wiredrive::driver {

/// Destination of a child's stdout/stderr: a truncated file, or the parent's
/// own streams. Shared with the pump threads so a detached pump never writes
/// to a closed descriptor.
class LogSink {
  struct Private {
    explicit Private() = default;
  };

public:
  /// Use open_file() or parent_streams().
  LogSink(Private, int fd, std::optional<std::filesystem::path> path);

  [[nodiscard]] static common::Result<std::shared_ptr<LogSink>>
  open_file(const std::filesystem::path &path);
  [[nodiscard]] static std::shared_ptr<LogSink> parent_streams();

  ~LogSink();
  LogSink(const LogSink &) = delete;
  LogSink &operator=(const LogSink &) = delete;

  /// `stream` is STDOUT_FILENO or STDERR_FILENO. Writes after close() are dropped.
  void write(int stream, const char *data, std::size_t size);
  [[nodiscard]] common::Status close();

  [[nodiscard]] bool is_file() const { return fd_ >= 0 || path_.has_value(); }
  [[nodiscard]] std::size_t failed_writes() const { return failed_writes_.load(); }

private:
  std::mutex mutex_;
  int fd_ = -1;
  std::optional<std::filesystem::path> path_;
  std::atomic<std::size_t> failed_writes_{0};
};

struct LaunchSpec {
  std::string binary;
  std::vector<std::string> args;
  /// Added to (or replacing entries of) the parent environment.
  std::map<std::string, std::string> env;
  /// Empty: the child writes to the parent's stdout/stderr.
  std::filesystem::path log_file;
};

/// Resolves a bare name through PATH; a name containing '/' is checked as is.
[[nodiscard]] common::Result<std::filesystem::path> resolve_executable(const std::string &binary);

/// A forked child running in its own process group, with two threads copying
/// its stdout and stderr into a LogSink.
class ChildProcess {
  struct Private {
    explicit Private() = default;
  };

public:
  ChildProcess(Private, pid_t pid, std::shared_ptr<LogSink> sink);

  [[nodiscard]] static common::Result<std::unique_ptr<ChildProcess>> spawn(const LaunchSpec &launch);

  ~ChildProcess();
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  [[nodiscard]] pid_t pid() const { return pid_; }
  [[nodiscard]] bool is_running();
  [[nodiscard]] std::optional<int> exit_status() const { return exit_status_; }

  /// Sends `signal` to the whole process group.
  [[nodiscard]] common::Status signal_group(int signal);

  /// True once the child has been reaped within `timeout`.
  [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

  /// SIGKILL to the group, then a blocking reap.
  [[nodiscard]] common::Status kill_and_reap();

  /// Joins pumps that finish within `timeout` and detaches the rest.
  /// Returns the number of pumps that had to be detached.
  std::size_t join_pumps(std::chrono::milliseconds timeout);

  [[nodiscard]] const std::shared_ptr<LogSink> &sink() const { return sink_; }

private:
  struct Pump {
    std::thread thread;
    std::future<void> done;
  };

  void start_pump(int fd, int stream);
  void record_exit(int status);

  pid_t pid_ = 0;
  std::optional<int> exit_status_;
  std::shared_ptr<LogSink> sink_;
  std::vector<Pump> pumps_;
};

} // namespace wiredrive::driver
