#include "wiredrive/protocol/transport.hpp"

#include "wiredrive/common/json_util.hpp"
#include "wiredrive/observability/factory.hpp"
#include "wiredrive/protocol/error_classifier.hpp"

#include <cctype>
#include <chrono>

namespace wiredrive::protocol {

namespace {

constexpr const char *kHexDigits = "0123456789ABCDEF";

bool is_redirect(const std::uint16_t status) { return status == 302 || status == 303; }

HttpHeaders request_headers(const std::string &method) {
  HttpHeaders headers{{"Accept", "application/json"}, {"Accept-Charset", "utf-8"}};
  if (method == "POST") {
    headers["Content-Type"] = "application/json;charset=utf-8";
  }
  return headers;
}

// "http://host:port" part of an absolute URL, empty when there is none.
std::string url_origin(const std::string &url) {
  const auto scheme = url.find("://");
  if (scheme == std::string::npos) {
    return "";
  }
  const auto path = url.find('/', scheme + 3);
  return path == std::string::npos ? url : url.substr(0, path);
}

} // namespace

std::string percent_encode(const std::string &segment) {
  std::string out;
  out.reserve(segment.size());
  for (const unsigned char ch : segment) {
    if (std::isalnum(ch) != 0 || ch == '-' || ch == '.' || ch == '_' || ch == '~') {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('%');
      out.push_back(kHexDigits[ch >> 4]);
      out.push_back(kHexDigits[ch & 0x0F]);
    }
  }
  return out;
}

common::Result<std::string> expand_path(const std::string &path_template,
                                        const std::vector<std::string> &params) {
  std::string out;
  std::size_t used = 0;
  std::size_t pos = 0;
  while (true) {
    const auto placeholder = path_template.find("{}", pos);
    if (placeholder == std::string::npos) {
      out += path_template.substr(pos);
      break;
    }
    out += path_template.substr(pos, placeholder - pos);
    if (used == params.size()) {
      return common::Result<std::string>::failure(common::protocol_error(
          "not enough parameters for " + path_template + ": got " + std::to_string(params.size())));
    }
    out += percent_encode(params[used++]);
    pos = placeholder + 2;
  }
  if (used != params.size()) {
    return common::Result<std::string>::failure(common::protocol_error(
        "too many parameters for " + path_template + ": got " + std::to_string(params.size())));
  }
  return common::Result<std::string>::success(std::move(out));
}

std::string resolve_location(const std::string &request_url, const std::string &location) {
  if (location.find("://") != std::string::npos) {
    return location;
  }
  if (!location.empty() && location.front() == '/') {
    return url_origin(request_url) + location;
  }
  const auto last_slash = request_url.rfind('/');
  const auto origin = url_origin(request_url);
  if (last_slash == std::string::npos || last_slash < origin.size()) {
    return origin + "/" + location;
  }
  return request_url.substr(0, last_slash + 1) + location;
}

Transport::Transport(std::shared_ptr<HttpClient> http,
                     std::shared_ptr<observability::IObserver> observer,
                     const std::uint64_t request_timeout_ms)
    : http_(std::move(http)), observer_(std::move(observer)),
      request_timeout_ms_(request_timeout_ms) {
  if (observer_ == nullptr) {
    observer_ = observability::noop_observer();
  }
}

void Transport::set_base_url(std::string base_url) { base_url_ = std::move(base_url); }

common::Result<Reply> Transport::execute(const std::string &method,
                                         const std::string &path_template,
                                         const std::vector<std::string> &params,
                                         const std::optional<std::string> &body) const {
  if (method != "GET" && method != "POST" && method != "DELETE") {
    return common::Result<Reply>::failure(common::protocol_error("invalid method: " + method));
  }
  auto path = expand_path(path_template, params);
  if (!path.ok()) {
    return common::Result<Reply>::failure(path.error());
  }

  std::string current_method = method;
  std::string url = base_url_ + path.value();
  std::optional<std::string> payload;
  if (method == "POST") {
    payload = body.value_or("{}");
  }

  for (int hop = 0;; ++hop) {
    const auto started = std::chrono::steady_clock::now();
    const HttpResponse response =
        http_->execute(current_method, url, request_headers(current_method), payload,
                       request_timeout_ms_);
    const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    observer_->record_metric(observability::RequestLatencyMetric{.latency = latency});

    if (response.network_error) {
      observer_->record_event(observability::CommandEvent{
          .method = current_method, .path = url, .http_status = 0, .duration = latency,
          .success = false});
      const std::string message = current_method + " " + url + ": " + response.network_error_message;
      return common::Result<Reply>::failure(response.timeout ? common::timeout_error(message)
                                                             : common::io_error(message));
    }

    // The redirect chain started by a POST is followed with GETs.
    const bool follow = current_method == "POST" || hop > 0;
    if (follow && is_redirect(response.status)) {
      observer_->record_event(observability::CommandEvent{.method = current_method,
                                                          .path = url,
                                                          .http_status = response.status,
                                                          .duration = latency,
                                                          .success = true});
      if (hop >= kMaxRedirects) {
        return common::Result<Reply>::failure(common::protocol_error(
            "too many redirects (" + std::to_string(kMaxRedirects) + ") from " + method + " " +
            base_url_ + path.value()));
      }
      const auto location = response.headers.find("location");
      if (location == response.headers.end() || location->second.empty()) {
        return common::Result<Reply>::failure(common::protocol_error(
            "redirect " + std::to_string(response.status) + " without Location from " + url));
      }
      const std::string next = resolve_location(url, location->second);
      observer_->record_event(
          observability::RedirectEvent{.from = url, .location = next, .hop = hop + 1});
      url = next;
      current_method = "GET";
      payload.reset();
      continue;
    }

    auto reply = decode(response.status, response.body);
    observer_->record_event(observability::CommandEvent{.method = current_method,
                                                        .path = url,
                                                        .http_status = response.status,
                                                        .duration = latency,
                                                        .success = reply.ok()});
    return reply;
  }
}

common::Result<Reply> Transport::decode(const std::uint16_t http_status,
                                        const std::string &body) const {
  auto envelope = decode_envelope(body);
  if (!envelope.ok()) {
    if (http_status == 200) {
      return common::Result<Reply>::failure(envelope.error());
    }
    if (http_status >= 400) {
      return common::Result<Reply>::failure(to_error(classify(http_status, Envelope{})));
    }
    return common::Result<Reply>::success(Reply{});
  }

  if (http_status >= 400 || envelope.value().status != kStatusSuccess) {
    return common::Result<Reply>::failure(to_error(classify(http_status, envelope.value())));
  }
  return common::Result<Reply>::success(
      Reply{.session_id = envelope.value().session_id, .value = envelope.value().value});
}

} // namespace wiredrive::protocol
