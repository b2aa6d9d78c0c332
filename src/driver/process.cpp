#include "wiredrive/driver/process.hpp"

#include "wiredrive/common/fs.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace wiredrive::driver {

namespace {

constexpr std::size_t kPumpBufferSize = 4096;
constexpr auto kReapPollInterval = std::chrono::milliseconds(20);

std::string errno_text(const int err) { return std::strerror(err); }

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool is_executable_file(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string> &overrides) {
  std::map<std::string, std::string> merged;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string kv(*entry);
    const auto eq = kv.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    merged[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  for (const auto &[name, value] : overrides) {
    merged[name] = value;
  }

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto &[name, value] : merged) {
    out.push_back(name + "=" + value);
  }
  return out;
}

std::vector<char *> as_c_array(std::vector<std::string> &values) {
  std::vector<char *> out;
  out.reserve(values.size() + 1);
  for (auto &value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

} // namespace

LogSink::LogSink(Private, const int fd, std::optional<std::filesystem::path> path)
    : fd_(fd), path_(std::move(path)) {}

LogSink::~LogSink() {
  std::lock_guard<std::mutex> lock(mutex_);
  close_fd(fd_);
}

common::Result<std::shared_ptr<LogSink>> LogSink::open_file(const std::filesystem::path &path) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    return common::Result<std::shared_ptr<LogSink>>::failure(common::io_error(
        "unable to open log file " + path.string() + ": " + errno_text(errno)));
  }
  return common::Result<std::shared_ptr<LogSink>>::success(
      std::make_shared<LogSink>(Private{}, fd, path));
}

std::shared_ptr<LogSink> LogSink::parent_streams() {
  return std::make_shared<LogSink>(Private{}, -1, std::nullopt);
}

void LogSink::write(const int stream, const char *data, std::size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  int target = fd_;
  if (!path_.has_value()) {
    target = stream;
  } else if (fd_ < 0) {
    return;
  }

  while (size > 0) {
    const ssize_t written = ::write(target, data, size);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      ++failed_writes_;
      return;
    }
    data += written;
    size -= static_cast<std::size_t>(written);
  }
}

common::Status LogSink::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    return common::Status::success();
  }
  const int rc = ::close(fd_);
  const int err = errno;
  fd_ = -1;
  if (rc != 0) {
    return common::Status::error(common::io_error(
        "closing log file " + path_.value_or("").string() + " failed: " + errno_text(err)));
  }
  return common::Status::success();
}

common::Result<std::filesystem::path> resolve_executable(const std::string &binary) {
  if (binary.empty()) {
    return common::Result<std::filesystem::path>::failure(
        common::config_error("no driver binary configured"));
  }

  if (binary.find('/') != std::string::npos) {
    if (is_executable_file(binary)) {
      return common::Result<std::filesystem::path>::success(std::filesystem::path(binary));
    }
    return common::Result<std::filesystem::path>::failure(
        common::io_error("binary missing or not executable: " + binary));
  }

  const char *path_env = std::getenv("PATH");
  std::stringstream dirs(path_env == nullptr ? "" : path_env);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    const auto candidate = std::filesystem::path(dir.empty() ? "." : dir) / binary;
    if (is_executable_file(candidate)) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
  }
  return common::Result<std::filesystem::path>::failure(
      common::io_error("binary not found in PATH: " + binary));
}

ChildProcess::ChildProcess(Private, const pid_t pid, std::shared_ptr<LogSink> sink)
    : pid_(pid), sink_(std::move(sink)) {}

common::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const LaunchSpec &launch) {
  using SpawnResult = common::Result<std::unique_ptr<ChildProcess>>;

  auto executable = resolve_executable(launch.binary);
  if (!executable.ok()) {
    return SpawnResult::failure(executable.error());
  }

  std::shared_ptr<LogSink> sink;
  if (launch.log_file.empty()) {
    sink = LogSink::parent_streams();
  } else {
    auto opened = LogSink::open_file(launch.log_file);
    if (!opened.ok()) {
      return SpawnResult::failure(opened.error());
    }
    sink = opened.value();
  }

  // Everything the child needs is built before fork.
  const std::string exec_path = executable.value().string();
  std::vector<std::string> argv_storage;
  argv_storage.reserve(launch.args.size() + 1);
  argv_storage.push_back(launch.binary);
  argv_storage.insert(argv_storage.end(), launch.args.begin(), launch.args.end());
  std::vector<std::string> env_storage = build_environment(launch.env);
  auto argv = as_c_array(argv_storage);
  auto envp = as_c_array(env_storage);

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int error_pipe[2] = {-1, -1};
  const auto close_all = [&]() {
    for (int *fds : {stdout_pipe, stderr_pipe, error_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
  };
  if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
      pipe2(error_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    close_all();
    return SpawnResult::failure(
        common::io_error("failed to create pipes for " + launch.binary + ": " + errno_text(err)));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    close_all();
    return SpawnResult::failure(
        common::io_error("failed to fork " + launch.binary + ": " + errno_text(err)));
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    execve(exec_path.c_str(), argv.data(), envp.data());
    const int err = errno;
    (void)!::write(error_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  (void)setpgid(pid, pid);
  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);
  close_fd(error_pipe[1]);

  // The error pipe closes on a successful exec; anything read is the child's errno.
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  close_fd(error_pipe[0]);

  if (got > 0) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);
    return SpawnResult::failure(common::io_error("exec " + exec_path +
                                                 " failed: " + errno_text(child_errno)));
  }

  auto child = std::make_unique<ChildProcess>(Private{}, pid, std::move(sink));
  child->start_pump(stdout_pipe[0], STDOUT_FILENO);
  child->start_pump(stderr_pipe[0], STDERR_FILENO);
  return SpawnResult::success(std::move(child));
}

ChildProcess::~ChildProcess() {
  if (pid_ > 0) {
    (void)kill_and_reap();
  }
  join_pumps(std::chrono::milliseconds(0));
}

void ChildProcess::start_pump(const int fd, const int stream) {
  std::promise<void> finished;
  Pump pump;
  pump.done = finished.get_future();
  pump.thread = std::thread(
      [fd, stream, sink = sink_, finished = std::move(finished)]() mutable {
        char buffer[kPumpBufferSize];
        while (true) {
          const ssize_t n = ::read(fd, buffer, sizeof(buffer));
          if (n > 0) {
            sink->write(stream, buffer, static_cast<std::size_t>(n));
            continue;
          }
          if (n < 0 && errno == EINTR) {
            continue;
          }
          break;
        }
        ::close(fd);
        finished.set_value();
      });
  pumps_.push_back(std::move(pump));
}

void ChildProcess::record_exit(const int status) {
  if (WIFEXITED(status)) {
    exit_status_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_status_ = 128 + WTERMSIG(status);
  }
  pid_ = 0;
}

bool ChildProcess::is_running() {
  if (pid_ <= 0) {
    return false;
  }
  int status = 0;
  const pid_t done = waitpid(pid_, &status, WNOHANG);
  if (done == pid_) {
    record_exit(status);
    return false;
  }
  return done == 0;
}

common::Status ChildProcess::signal_group(const int signal) {
  if (pid_ <= 0) {
    return common::Status::error(common::state_error("process already exited"));
  }
  if (kill(-pid_, signal) != 0) {
    return common::Status::error(common::io_error("signal " + std::to_string(signal) +
                                                  " to process group " + std::to_string(pid_) +
                                                  " failed: " + errno_text(errno)));
  }
  return common::Status::success();
}

bool ChildProcess::wait_for_exit(const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (!is_running()) {
      return pid_ == 0;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(kReapPollInterval);
  }
}

common::Status ChildProcess::kill_and_reap() {
  if (pid_ <= 0) {
    return common::Status::success();
  }
  common::Status signalled = common::Status::success();
  if (kill(-pid_, SIGKILL) != 0 && kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
    signalled = common::Status::error(common::io_error(
        "SIGKILL to " + std::to_string(pid_) + " failed: " + errno_text(errno)));
  }
  int status = 0;
  pid_t done = 0;
  do {
    done = waitpid(pid_, &status, 0);
  } while (done < 0 && errno == EINTR);
  if (done == pid_) {
    record_exit(status);
  } else {
    pid_ = 0;
  }
  return signalled;
}

std::size_t ChildProcess::join_pumps(const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t detached = 0;
  for (auto &pump : pumps_) {
    if (!pump.thread.joinable()) {
      continue;
    }
    const auto now = std::chrono::steady_clock::now();
    const auto remaining = now < deadline ? deadline - now : std::chrono::steady_clock::duration{0};
    if (pump.done.wait_for(remaining) == std::future_status::ready) {
      pump.thread.join();
    } else {
      pump.thread.detach();
      ++detached;
    }
  }
  pumps_.clear();
  return detached;
}

} // namespace wiredrive::driver
