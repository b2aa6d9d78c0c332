#pragma once

#include "wiredrive/common/result.hpp"
#include "wiredrive/protocol/session.hpp"
#include "wiredrive/protocol/transport.hpp"
#include "wiredrive/protocol/types.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace wiredrive::protocol {

/// Server-level commands. Point the transport at a running driver or remote server first.
class Client {
public:
  explicit Client(std::shared_ptr<const Transport> transport);

  [[nodiscard]] const Transport &transport() const { return *transport_; }

  [[nodiscard]] common::Result<ServerStatus> status() const;

  /// Desired capabilities default to `{}`; absent required capabilities are sent as null.
  [[nodiscard]] common::Result<std::shared_ptr<const Session>>
  new_session(const Capabilities &desired = {},
              const std::optional<Capabilities> &required = std::nullopt) const;

  [[nodiscard]] common::Result<std::vector<std::shared_ptr<const Session>>> sessions() const;

private:
  std::shared_ptr<const Transport> transport_;
};

} // namespace wiredrive::protocol
