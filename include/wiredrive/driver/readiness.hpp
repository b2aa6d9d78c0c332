#pragma once

#include "wiredrive/common/result.hpp"

#include <chrono>
#include <cstdint>

namespace wiredrive::driver {

struct ProbeOptions {
  std::chrono::milliseconds timeout{20'000};
  std::chrono::milliseconds interval{1'000};
};

/// Single connect attempt against 127.0.0.1:port.
[[nodiscard]] bool can_connect(std::uint16_t port);

/// Polls until something accepts connections on the port. Only reachability
/// is checked, not the protocol spoken.
[[nodiscard]] common::Status wait_until_listening(std::uint16_t port, const ProbeOptions &options);

} // namespace wiredrive::driver
