#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace wiredrive::protocol {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  // Keys are lowercased.
  HttpHeaders headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

/// Single HTTP exchange. Implementations never follow redirects.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse execute(const std::string &method, const std::string &url,
                                             const HttpHeaders &headers,
                                             const std::optional<std::string> &body,
                                             std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse execute(const std::string &method, const std::string &url,
                                     const HttpHeaders &headers,
                                     const std::optional<std::string> &body,
                                     std::uint64_t timeout_ms) override;
};

} // namespace wiredrive::protocol
