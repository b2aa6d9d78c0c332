#pragma once

#include "wiredrive/common/result.hpp"
#include "wiredrive/observability/observer.hpp"
#include "wiredrive/protocol/http_client.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wiredrive::protocol {

inline constexpr int kMaxRedirects = 3;
inline constexpr std::uint64_t kDefaultRequestTimeoutMs = 300000;

/// Successful command reply. `value` is the undecoded JSON of the envelope's value.
struct Reply {
  std::string session_id;
  std::string value = "null";
};

/// Percent-encodes everything outside the RFC 3986 unreserved set.
[[nodiscard]] std::string percent_encode(const std::string &segment);

/// Replaces each `{}` in `path_template` with the next encoded parameter.
[[nodiscard]] common::Result<std::string> expand_path(const std::string &path_template,
                                                      const std::vector<std::string> &params);

/// Absolute `location` is returned as is; otherwise resolved against `request_url`.
[[nodiscard]] std::string resolve_location(const std::string &request_url,
                                           const std::string &location);

/// Sends wire protocol commands to a driver or remote server.
class Transport {
public:
  Transport(std::shared_ptr<HttpClient> http,
            std::shared_ptr<observability::IObserver> observer = nullptr,
            std::uint64_t request_timeout_ms = kDefaultRequestTimeoutMs);

  void set_base_url(std::string base_url);
  [[nodiscard]] const std::string &base_url() const { return base_url_; }

  [[nodiscard]] common::Result<Reply>
  execute(const std::string &method, const std::string &path_template,
          const std::vector<std::string> &params = {},
          const std::optional<std::string> &body = std::nullopt) const;

private:
  [[nodiscard]] common::Result<Reply> decode(std::uint16_t http_status,
                                             const std::string &body) const;

  std::shared_ptr<HttpClient> http_;
  std::shared_ptr<observability::IObserver> observer_;
  std::uint64_t request_timeout_ms_ = kDefaultRequestTimeoutMs;
  std::string base_url_;
};

} // namespace wiredrive::protocol
