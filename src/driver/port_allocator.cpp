#include "wiredrive/driver/port_allocator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace wiredrive::driver {

namespace {

sockaddr_in loopback_address(const std::uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  return addr;
}

int try_listen(const std::uint16_t port) {
  const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return -1;
  }
  auto addr = loopback_address(port);
  if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 || listen(fd, 1) != 0) {
    close(fd);
    return -1;
  }
  return fd;
}

} // namespace

PortLease::PortLease(const int fd, const std::uint16_t lock_port) : fd_(fd), lock_port_(lock_port) {}

PortLease::~PortLease() { release(); }

PortLease::PortLease(PortLease &&other) noexcept : fd_(other.fd_), lock_port_(other.lock_port_) {
  other.fd_ = -1;
  other.lock_port_ = 0;
}

PortLease &PortLease::operator=(PortLease &&other) noexcept {
  if (this != &other) {
    release();
    fd_ = other.fd_;
    lock_port_ = other.lock_port_;
    other.fd_ = -1;
    other.lock_port_ = 0;
  }
  return *this;
}

void PortLease::release() {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
}

bool is_port_available(const std::uint16_t port) {
  const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return false;
  }
  int reuse = 1;
  (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
  auto addr = loopback_address(port);
  const int rc = bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  close(fd);
  return rc == 0;
}

common::Result<PortLease> acquire_port_lock(const std::uint16_t lock_port,
                                            const std::chrono::milliseconds timeout,
                                            const std::chrono::milliseconds retry_interval) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const int fd = try_listen(lock_port);
    if (fd >= 0) {
      return common::Result<PortLease>::success(PortLease(fd, lock_port));
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return common::Result<PortLease>::failure(common::timeout_error(
          "timed out waiting for port lock on " + std::to_string(lock_port)));
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(retry_interval, remaining));
  }
}

common::Result<PortAllocation> allocate_port(const std::uint16_t requested,
                                             const PortAllocatorOptions &options) {
  if (requested != 0) {
    return common::Result<PortAllocation>::success(PortAllocation{.port = requested});
  }
  if (options.base_port < 2) {
    return common::Result<PortAllocation>::failure(
        common::config_error("base port must be at least 2"));
  }

  auto lease = acquire_port_lock(static_cast<std::uint16_t>(options.base_port - 1),
                                 options.lock_timeout, options.lock_retry_interval);
  if (!lease.ok()) {
    return common::Result<PortAllocation>::failure(lease.error());
  }

  for (std::uint32_t port = options.base_port; port <= 65535; ++port) {
    if (is_port_available(static_cast<std::uint16_t>(port))) {
      PortAllocation allocation;
      allocation.port = static_cast<std::uint16_t>(port);
      allocation.lease = std::move(lease.value());
      return common::Result<PortAllocation>::success(std::move(allocation));
    }
  }

  return common::Result<PortAllocation>::failure(common::io_error(
      "no free port at or above " + std::to_string(options.base_port)));
}

} // namespace wiredrive::driver
