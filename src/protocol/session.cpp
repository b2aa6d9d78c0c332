#include "wiredrive/protocol/session.hpp"

#include "wiredrive/common/json_util.hpp"
#include "wiredrive/protocol/value_codec.hpp"

#include <type_traits>

namespace wiredrive::protocol {

namespace {

common::Status to_status(const common::Result<Reply> &reply) {
  if (!reply.ok()) {
    return common::Status::error(reply.error());
  }
  return common::Status::success();
}

template <typename T, typename Decode>
common::Result<T> decode_reply(const common::Result<Reply> &reply, Decode decode) {
  if (!reply.ok()) {
    return common::Result<T>::failure(reply.error());
  }
  return decode(reply.value().value);
}

std::string locator_body(const LocatorStrategy strategy, const std::string &value) {
  return common::json_object({{"using", common::json_quote(std::string(locator_strategy_name(strategy)))},
                              {"value", common::json_quote(value)}});
}

std::string keys_body(const std::string &sequence) {
  return common::json_object({{"value", common::json_string_array(split_key_sequence(sequence))}});
}

std::string script_body(const std::string &script, const std::vector<std::string> &args) {
  return common::json_object({{"script", common::json_quote(script)}, {"args", common::json_array(args)}});
}

std::string frame_body(const FrameId &frame) {
  const std::string id = std::visit(
      [](const auto &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(value);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return common::json_quote(value);
        } else {
          return encode_element_reference(value.id());
        }
      },
      frame);
  return common::json_object({{"id", id}});
}

common::Result<WebElement> to_element(const std::shared_ptr<const Session> &session,
                                      const common::Result<Reply> &reply) {
  return decode_reply<WebElement>(reply, [&](const std::string &raw) {
    auto id = decode_element_id(raw);
    if (!id.ok()) {
      return common::Result<WebElement>::failure(id.error());
    }
    return common::Result<WebElement>::success(WebElement(session, id.value()));
  });
}

common::Result<std::vector<WebElement>> to_elements(const std::shared_ptr<const Session> &session,
                                                    const common::Result<Reply> &reply) {
  return decode_reply<std::vector<WebElement>>(reply, [&](const std::string &raw) {
    auto ids = decode_element_ids(raw);
    if (!ids.ok()) {
      return common::Result<std::vector<WebElement>>::failure(ids.error());
    }
    std::vector<WebElement> elements;
    elements.reserve(ids.value().size());
    for (auto &id : ids.value()) {
      elements.emplace_back(session, std::move(id));
    }
    return common::Result<std::vector<WebElement>>::success(std::move(elements));
  });
}

} // namespace

WindowHandle::WindowHandle(std::shared_ptr<const Session> session, std::string id)
    : session_(std::move(session)), id_(std::move(id)) {}

common::Result<Size> WindowHandle::size() const {
  return decode_reply<Size>(session_->execute("GET", "/window/{}/size", {id_}), decode_size);
}

common::Status WindowHandle::set_size(const Size size) const {
  return to_status(session_->execute(
      "POST", "/window/{}/size", {id_},
      common::json_object({{"width", std::to_string(size.width)},
                           {"height", std::to_string(size.height)}})));
}

common::Result<Position> WindowHandle::position() const {
  return decode_reply<Position>(session_->execute("GET", "/window/{}/position", {id_}),
                                decode_position);
}

common::Status WindowHandle::set_position(const Position position) const {
  return to_status(session_->execute(
      "POST", "/window/{}/position", {id_},
      common::json_object({{"x", std::to_string(position.x)}, {"y", std::to_string(position.y)}})));
}

common::Status WindowHandle::maximize() const {
  return to_status(session_->execute("POST", "/window/{}/maximize", {id_}));
}

WebElement::WebElement(std::shared_ptr<const Session> session, std::string id)
    : session_(std::move(session)), id_(std::move(id)) {}

common::Result<WebElement> WebElement::find_element(const LocatorStrategy using_strategy,
                                                    const std::string &value) const {
  return to_element(session_, session_->execute("POST", "/element/{}/element", {id_},
                                                locator_body(using_strategy, value)));
}

common::Result<std::vector<WebElement>>
WebElement::find_elements(const LocatorStrategy using_strategy, const std::string &value) const {
  return to_elements(session_, session_->execute("POST", "/element/{}/elements", {id_},
                                                 locator_body(using_strategy, value)));
}

common::Status WebElement::click() const {
  return to_status(session_->execute("POST", "/element/{}/click", {id_}));
}

common::Status WebElement::submit() const {
  return to_status(session_->execute("POST", "/element/{}/submit", {id_}));
}

common::Status WebElement::clear() const {
  return to_status(session_->execute("POST", "/element/{}/clear", {id_}));
}

common::Status WebElement::send_keys(const std::string &sequence) const {
  return to_status(session_->execute("POST", "/element/{}/value", {id_}, keys_body(sequence)));
}

common::Result<std::string> WebElement::text() const {
  return decode_reply<std::string>(session_->execute("GET", "/element/{}/text", {id_}),
                                   decode_string_value);
}

common::Result<std::string> WebElement::name() const {
  return decode_reply<std::string>(session_->execute("GET", "/element/{}/name", {id_}),
                                   decode_string_value);
}

common::Result<bool> WebElement::is_selected() const {
  return decode_reply<bool>(session_->execute("GET", "/element/{}/selected", {id_}),
                            decode_bool_value);
}

common::Result<bool> WebElement::is_enabled() const {
  return decode_reply<bool>(session_->execute("GET", "/element/{}/enabled", {id_}),
                            decode_bool_value);
}

common::Result<bool> WebElement::is_displayed() const {
  return decode_reply<bool>(session_->execute("GET", "/element/{}/displayed", {id_}),
                            decode_bool_value);
}

common::Result<std::string> WebElement::attribute(const std::string &name) const {
  // A missing attribute comes back as null.
  return decode_reply<std::string>(
      session_->execute("GET", "/element/{}/attribute/{}", {id_, name}),
      [](const std::string &raw) {
        if (common::json_is_null(raw)) {
          return common::Result<std::string>::success("");
        }
        return decode_string_value(raw);
      });
}

common::Result<std::string> WebElement::css_property(const std::string &name) const {
  return decode_reply<std::string>(session_->execute("GET", "/element/{}/css/{}", {id_, name}),
                                   decode_string_value);
}

common::Result<Position> WebElement::location() const {
  return decode_reply<Position>(session_->execute("GET", "/element/{}/location", {id_}),
                                decode_position);
}

common::Result<Size> WebElement::size() const {
  return decode_reply<Size>(session_->execute("GET", "/element/{}/size", {id_}), decode_size);
}

common::Result<bool> WebElement::equals(const WebElement &other) const {
  return decode_reply<bool>(session_->execute("GET", "/element/{}/equal/{}", {id_, other.id_}),
                            decode_bool_value);
}

Session::Session(std::shared_ptr<const Transport> transport, std::string id,
                 Capabilities capabilities)
    : transport_(std::move(transport)), id_(std::move(id)),
      capabilities_(std::move(capabilities)) {}

common::Result<Reply> Session::execute(const std::string &method, const std::string &path,
                                       const std::vector<std::string> &params,
                                       const std::optional<std::string> &body) const {
  std::vector<std::string> all_params;
  all_params.reserve(params.size() + 1);
  all_params.push_back(id_);
  all_params.insert(all_params.end(), params.begin(), params.end());
  return transport_->execute(method, "/session/{}" + path, all_params, body);
}

common::Status Session::close() const { return to_status(execute("DELETE", "")); }

common::Status Session::set_timeout(const std::string &type, const std::int64_t ms) const {
  return to_status(execute(
      "POST", "/timeouts", {},
      common::json_object({{"type", common::json_quote(type)}, {"ms", std::to_string(ms)}})));
}

common::Status Session::set_async_script_timeout(const std::int64_t ms) const {
  return to_status(execute("POST", "/timeouts/async_script", {},
                           common::json_object({{"ms", std::to_string(ms)}})));
}

common::Status Session::set_implicit_wait_timeout(const std::int64_t ms) const {
  return to_status(execute("POST", "/timeouts/implicit_wait", {},
                           common::json_object({{"ms", std::to_string(ms)}})));
}

WindowHandle Session::current_window() const { return WindowHandle(shared_from_this(), "current"); }

common::Result<WindowHandle> Session::window_handle() const {
  auto self = shared_from_this();
  return decode_reply<WindowHandle>(execute("GET", "/window_handle"), [&](const std::string &raw) {
    auto id = decode_string_value(raw);
    if (!id.ok()) {
      return common::Result<WindowHandle>::failure(id.error());
    }
    return common::Result<WindowHandle>::success(WindowHandle(self, id.value()));
  });
}

common::Result<std::vector<WindowHandle>> Session::window_handles() const {
  auto self = shared_from_this();
  return decode_reply<std::vector<WindowHandle>>(
      execute("GET", "/window_handles"), [&](const std::string &raw) {
        auto ids = decode_string_list_value(raw);
        if (!ids.ok()) {
          return common::Result<std::vector<WindowHandle>>::failure(ids.error());
        }
        std::vector<WindowHandle> handles;
        handles.reserve(ids.value().size());
        for (auto &id : ids.value()) {
          handles.emplace_back(self, std::move(id));
        }
        return common::Result<std::vector<WindowHandle>>::success(std::move(handles));
      });
}

common::Status Session::focus_window(const std::string &name) const {
  return to_status(
      execute("POST", "/window", {}, common::json_object({{"name", common::json_quote(name)}})));
}

common::Status Session::close_window() const { return to_status(execute("DELETE", "/window")); }

common::Status Session::focus_frame(const FrameId &frame) const {
  return to_status(execute("POST", "/frame", {}, frame_body(frame)));
}

common::Status Session::focus_parent_frame() const {
  return to_status(execute("POST", "/frame/parent"));
}

common::Result<std::string> Session::url() const {
  return decode_reply<std::string>(execute("GET", "/url"), decode_string_value);
}

common::Status Session::navigate(const std::string &url) const {
  return to_status(
      execute("POST", "/url", {}, common::json_object({{"url", common::json_quote(url)}})));
}

common::Status Session::forward() const { return to_status(execute("POST", "/forward")); }

common::Status Session::back() const { return to_status(execute("POST", "/back")); }

common::Status Session::refresh() const { return to_status(execute("POST", "/refresh")); }

common::Result<std::string> Session::title() const {
  return decode_reply<std::string>(execute("GET", "/title"), decode_string_value);
}

common::Result<std::string> Session::source() const {
  return decode_reply<std::string>(execute("GET", "/source"), decode_string_value);
}

common::Result<std::string> Session::execute_script(const std::string &script,
                                                    const std::vector<std::string> &args) const {
  return decode_reply<std::string>(execute("POST", "/execute", {}, script_body(script, args)),
                                   [](const std::string &raw) {
                                     return common::Result<std::string>::success(raw);
                                   });
}

common::Result<std::string>
Session::execute_async_script(const std::string &script,
                              const std::vector<std::string> &args) const {
  return decode_reply<std::string>(execute("POST", "/execute_async", {}, script_body(script, args)),
                                   [](const std::string &raw) {
                                     return common::Result<std::string>::success(raw);
                                   });
}

common::Result<std::vector<std::uint8_t>> Session::screenshot() const {
  return decode_reply<std::vector<std::uint8_t>>(
      execute("GET", "/screenshot"), [](const std::string &raw) {
        auto encoded = decode_string_value(raw);
        if (!encoded.ok()) {
          return common::Result<std::vector<std::uint8_t>>::failure(encoded.error());
        }
        return decode_base64(encoded.value());
      });
}

WebElement Session::element_from_id(std::string id) const {
  return WebElement(shared_from_this(), std::move(id));
}

common::Result<WebElement> Session::find_element(const LocatorStrategy using_strategy,
                                                 const std::string &value) const {
  return to_element(shared_from_this(),
                    execute("POST", "/element", {}, locator_body(using_strategy, value)));
}

common::Result<std::vector<WebElement>>
Session::find_elements(const LocatorStrategy using_strategy, const std::string &value) const {
  return to_elements(shared_from_this(),
                     execute("POST", "/elements", {}, locator_body(using_strategy, value)));
}

common::Result<WebElement> Session::active_element() const {
  return to_element(shared_from_this(), execute("POST", "/element/active"));
}

common::Result<std::vector<Cookie>> Session::cookies() const {
  return decode_reply<std::vector<Cookie>>(execute("GET", "/cookie"), decode_cookies);
}

common::Status Session::add_cookie(const Cookie &cookie) const {
  return to_status(
      execute("POST", "/cookie", {}, common::json_object({{"cookie", encode_cookie(cookie)}})));
}

common::Status Session::delete_cookies() const { return to_status(execute("DELETE", "/cookie")); }

common::Status Session::delete_cookie(const std::string &name) const {
  return to_status(execute("DELETE", "/cookie/{}", {name}));
}

common::Result<std::string> Session::alert_text() const {
  return decode_reply<std::string>(execute("GET", "/alert_text"), decode_string_value);
}

common::Status Session::set_alert_text(const std::string &text) const {
  return to_status(
      execute("POST", "/alert_text", {}, common::json_object({{"text", common::json_quote(text)}})));
}

common::Status Session::accept_alert() const { return to_status(execute("POST", "/accept_alert")); }

common::Status Session::dismiss_alert() const {
  return to_status(execute("POST", "/dismiss_alert"));
}

common::Status Session::send_keys(const std::string &sequence) const {
  return to_status(execute("POST", "/keys", {}, keys_body(sequence)));
}

} // namespace wiredrive::protocol
