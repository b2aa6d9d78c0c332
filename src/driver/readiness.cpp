#include "wiredrive/driver/readiness.hpp"

#include <algorithm>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace wiredrive::driver {

bool can_connect(const std::uint16_t port) {
  const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  const int rc = connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  close(fd);
  return rc == 0;
}

common::Status wait_until_listening(const std::uint16_t port, const ProbeOptions &options) {
  const auto deadline = std::chrono::steady_clock::now() + options.timeout;
  while (true) {
    if (can_connect(port)) {
      return common::Status::success();
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return common::Status::error(common::timeout_error("start failed: timeout expired"));
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(options.interval, remaining));
  }
}

} // namespace wiredrive::driver
