#pragma once

#include "wiredrive/common/result.hpp"
#include "wiredrive/protocol/transport.hpp"
#include "wiredrive/protocol/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace wiredrive::protocol {

class Session;

class WindowHandle {
public:
  WindowHandle(std::shared_ptr<const Session> session, std::string id);

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const Session &session() const { return *session_; }

  [[nodiscard]] common::Result<Size> size() const;
  [[nodiscard]] common::Status set_size(Size size) const;
  [[nodiscard]] common::Result<Position> position() const;
  [[nodiscard]] common::Status set_position(Position position) const;
  [[nodiscard]] common::Status maximize() const;

private:
  std::shared_ptr<const Session> session_;
  std::string id_;
};

class WebElement {
public:
  WebElement(std::shared_ptr<const Session> session, std::string id);

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const Session &session() const { return *session_; }

  [[nodiscard]] common::Result<WebElement> find_element(LocatorStrategy using_strategy,
                                                        const std::string &value) const;
  [[nodiscard]] common::Result<std::vector<WebElement>>
  find_elements(LocatorStrategy using_strategy, const std::string &value) const;

  [[nodiscard]] common::Status click() const;
  [[nodiscard]] common::Status submit() const;
  [[nodiscard]] common::Status clear() const;
  [[nodiscard]] common::Status send_keys(const std::string &sequence) const;

  [[nodiscard]] common::Result<std::string> text() const;
  /// Tag name.
  [[nodiscard]] common::Result<std::string> name() const;
  [[nodiscard]] common::Result<bool> is_selected() const;
  [[nodiscard]] common::Result<bool> is_enabled() const;
  [[nodiscard]] common::Result<bool> is_displayed() const;
  [[nodiscard]] common::Result<std::string> attribute(const std::string &name) const;
  [[nodiscard]] common::Result<std::string> css_property(const std::string &name) const;
  [[nodiscard]] common::Result<Position> location() const;
  [[nodiscard]] common::Result<Size> size() const;

  /// Asks the server whether both references point at the same DOM node.
  [[nodiscard]] common::Result<bool> equals(const WebElement &other) const;

private:
  std::shared_ptr<const Session> session_;
  std::string id_;
};

/// Frame selector: top-level document, index, name or id, or an element.
using FrameId = std::variant<std::monostate, std::int64_t, std::string, WebElement>;

/// A server-side session. Always owned through a shared_ptr so that windows and
/// elements can refer back to it.
class Session : public std::enable_shared_from_this<Session> {
public:
  Session(std::shared_ptr<const Transport> transport, std::string id, Capabilities capabilities);

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const Capabilities &capabilities() const { return capabilities_; }
  [[nodiscard]] const Transport &transport() const { return *transport_; }

  /// Runs a command under `/session/<id>`; `path` uses `{}` placeholders for `params`.
  [[nodiscard]] common::Result<Reply>
  execute(const std::string &method, const std::string &path,
          const std::vector<std::string> &params = {},
          const std::optional<std::string> &body = std::nullopt) const;

  [[nodiscard]] common::Status close() const;

  [[nodiscard]] common::Status set_timeout(const std::string &type, std::int64_t ms) const;
  [[nodiscard]] common::Status set_async_script_timeout(std::int64_t ms) const;
  [[nodiscard]] common::Status set_implicit_wait_timeout(std::int64_t ms) const;

  [[nodiscard]] WindowHandle current_window() const;
  [[nodiscard]] common::Result<WindowHandle> window_handle() const;
  [[nodiscard]] common::Result<std::vector<WindowHandle>> window_handles() const;
  [[nodiscard]] common::Status focus_window(const std::string &name) const;
  [[nodiscard]] common::Status close_window() const;
  [[nodiscard]] common::Status focus_frame(const FrameId &frame) const;
  [[nodiscard]] common::Status focus_parent_frame() const;

  [[nodiscard]] common::Result<std::string> url() const;
  [[nodiscard]] common::Status navigate(const std::string &url) const;
  [[nodiscard]] common::Status forward() const;
  [[nodiscard]] common::Status back() const;
  [[nodiscard]] common::Status refresh() const;
  [[nodiscard]] common::Result<std::string> title() const;
  [[nodiscard]] common::Result<std::string> source() const;

  /// Arguments are raw JSON values; the result is the raw JSON value.
  [[nodiscard]] common::Result<std::string>
  execute_script(const std::string &script, const std::vector<std::string> &args = {}) const;
  [[nodiscard]] common::Result<std::string>
  execute_async_script(const std::string &script, const std::vector<std::string> &args = {}) const;

  /// PNG bytes.
  [[nodiscard]] common::Result<std::vector<std::uint8_t>> screenshot() const;

  [[nodiscard]] WebElement element_from_id(std::string id) const;
  [[nodiscard]] common::Result<WebElement> find_element(LocatorStrategy using_strategy,
                                                        const std::string &value) const;
  [[nodiscard]] common::Result<std::vector<WebElement>>
  find_elements(LocatorStrategy using_strategy, const std::string &value) const;
  [[nodiscard]] common::Result<WebElement> active_element() const;

  [[nodiscard]] common::Result<std::vector<Cookie>> cookies() const;
  [[nodiscard]] common::Status add_cookie(const Cookie &cookie) const;
  [[nodiscard]] common::Status delete_cookies() const;
  [[nodiscard]] common::Status delete_cookie(const std::string &name) const;

  [[nodiscard]] common::Result<std::string> alert_text() const;
  [[nodiscard]] common::Status set_alert_text(const std::string &text) const;
  [[nodiscard]] common::Status accept_alert() const;
  [[nodiscard]] common::Status dismiss_alert() const;

  /// Sends keys to the active element.
  [[nodiscard]] common::Status send_keys(const std::string &sequence) const;

private:
  std::shared_ptr<const Transport> transport_;
  std::string id_;
  Capabilities capabilities_;
};

} // namespace wiredrive::protocol
