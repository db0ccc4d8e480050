#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace distill::providers {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

/// Human-readable reason for a failed response; empty for a 2xx response.
[[nodiscard]] std::string describe_http_failure(const HttpResponse &response);

/// Message text of an OpenAI-style `{"error":{"message":...}}` body, if any.
[[nodiscard]] std::string api_error_message(const std::string &body);

} // namespace distill::providers
