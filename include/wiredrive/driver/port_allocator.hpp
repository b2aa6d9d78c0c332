#pragma once

#include "wiredrive/common/result.hpp"

#include <chrono>
#include <cstdint>

namespace wiredrive::driver {

/// Exclusive advisory lock held by listening on a loopback port. Released on
/// destruction.
class PortLease {
public:
  PortLease() = default;
  PortLease(int fd, std::uint16_t lock_port);
  ~PortLease();

  PortLease(const PortLease &) = delete;
  PortLease &operator=(const PortLease &) = delete;
  PortLease(PortLease &&other) noexcept;
  PortLease &operator=(PortLease &&other) noexcept;

  [[nodiscard]] bool held() const { return fd_ >= 0; }
  [[nodiscard]] std::uint16_t lock_port() const { return lock_port_; }
  void release();

private:
  int fd_ = -1;
  std::uint16_t lock_port_ = 0;
};

struct PortAllocation {
  std::uint16_t port = 0;
  /// Not held when the caller asked for a fixed port.
  PortLease lease;
};

struct PortAllocatorOptions {
  std::uint16_t base_port = 0;
  std::chrono::milliseconds lock_timeout{60'000};
  std::chrono::milliseconds lock_retry_interval{1'000};
};

/// True when a listener could bind 127.0.0.1:port right now.
[[nodiscard]] bool is_port_available(std::uint16_t port);

[[nodiscard]] common::Result<PortLease> acquire_port_lock(std::uint16_t lock_port,
                                                          std::chrono::milliseconds timeout,
                                                          std::chrono::milliseconds retry_interval);

/// A non-zero `requested` port is returned as is. Otherwise the lock on
/// `base_port - 1` is taken and the first bindable port at or above
/// `base_port` is returned together with the lease. The port is not reserved:
/// another process may still bind it before the driver does.
[[nodiscard]] common::Result<PortAllocation> allocate_port(std::uint16_t requested,
                                                           const PortAllocatorOptions &options);

} // namespace wiredrive::driver
