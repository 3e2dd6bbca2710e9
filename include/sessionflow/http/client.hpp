#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace sessionflow::http {

using Headers = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  // Keys are lower-cased.
  Headers headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

/// "sessionflow/<version>", sent on every request.
[[nodiscard]] std::string user_agent();

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse get(const std::string &url, const Headers &headers,
                                         std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const Headers &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse patch_json(const std::string &url, const Headers &headers,
                                                const std::string &body,
                                                std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse get(const std::string &url, const Headers &headers,
                                 std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json(const std::string &url, const Headers &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse patch_json(const std::string &url, const Headers &headers,
                                        const std::string &body,
                                        std::uint64_t timeout_ms) override;
};

} // namespace sessionflow::http
