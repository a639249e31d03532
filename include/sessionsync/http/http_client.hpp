#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace sessionsync::http {

using Headers = std::unordered_map<std::string, std::string>;

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  Headers headers;
  std::optional<std::string> body;
  std::uint64_t timeout_ms = 30000;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  Headers headers; // keys lower-cased
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool is_success() const { return status >= 200 && status < 300; }
  [[nodiscard]] std::string header(const std::string &lowercase_name) const;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse send(const HttpRequest &request) = 0;

  [[nodiscard]] HttpResponse get(const std::string &url, const Headers &headers,
                                 std::uint64_t timeout_ms);
  [[nodiscard]] HttpResponse post(const std::string &url, const Headers &headers,
                                  const std::string &body, std::uint64_t timeout_ms);
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse send(const HttpRequest &request) override;
};

} // namespace sessionsync::http
