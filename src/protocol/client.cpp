#include "wiredrive/protocol/client.hpp"

#include "wiredrive/common/json_util.hpp"
#include "wiredrive/protocol/value_codec.hpp"

namespace wiredrive::protocol {

Client::Client(std::shared_ptr<const Transport> transport) : transport_(std::move(transport)) {}

common::Result<ServerStatus> Client::status() const {
  auto reply = transport_->execute("GET", "/status");
  if (!reply.ok()) {
    return common::Result<ServerStatus>::failure(reply.error());
  }
  return decode_server_status(reply.value().value);
}

common::Result<std::shared_ptr<const Session>>
Client::new_session(const Capabilities &desired, const std::optional<Capabilities> &required) const {
  using SessionResult = common::Result<std::shared_ptr<const Session>>;

  const std::string body = common::json_object(
      {{"desiredCapabilities", encode_capabilities(desired)},
       {"requiredCapabilities", required.has_value() ? encode_capabilities(*required) : "null"}});
  auto reply = transport_->execute("POST", "/session", {}, body);
  if (!reply.ok()) {
    return SessionResult::failure(reply.error());
  }
  if (reply.value().session_id.empty()) {
    return SessionResult::failure(common::protocol_error("new session response carried no sessionId"));
  }

  auto capabilities = decode_capabilities(reply.value().value);
  if (!capabilities.ok()) {
    return SessionResult::failure(capabilities.error());
  }
  return SessionResult::success(std::make_shared<Session>(
      transport_, reply.value().session_id, std::move(capabilities.value())));
}

common::Result<std::vector<std::shared_ptr<const Session>>> Client::sessions() const {
  using SessionsResult = common::Result<std::vector<std::shared_ptr<const Session>>>;

  auto reply = transport_->execute("GET", "/sessions");
  if (!reply.ok()) {
    return SessionsResult::failure(reply.error());
  }

  std::vector<std::shared_ptr<const Session>> sessions;
  if (common::json_is_null(reply.value().value)) {
    return SessionsResult::success(std::move(sessions));
  }
  const auto items = common::json_split_top_level_values(reply.value().value);
  if (!items.has_value()) {
    return SessionsResult::failure(
        common::protocol_error("unexpected value for sessions: " + reply.value().value));
  }
  for (const auto &item : *items) {
    const auto fields = common::json_top_level_fields(item);
    const auto raw_id = fields.has_value() ? common::json_member(*fields, "id") : std::nullopt;
    const auto id = raw_id.has_value() ? common::json_decode_string(*raw_id) : std::nullopt;
    if (!id.has_value()) {
      return SessionsResult::failure(common::protocol_error("unexpected session entry: " + item));
    }
    auto capabilities = decode_capabilities(
        common::json_member(*fields, "capabilities").value_or("null"));
    if (!capabilities.ok()) {
      return SessionsResult::failure(capabilities.error());
    }
    sessions.push_back(
        std::make_shared<Session>(transport_, *id, std::move(capabilities.value())));
  }
  return SessionsResult::success(std::move(sessions));
}

} // namespace wiredrive::protocol
