#pragma once

#include "ragsync/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ragsync::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse head(const std::string &url, const HttpHeaders &headers,
                                          std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse head(const std::string &url, const HttpHeaders &headers,
                                  std::uint64_t timeout_ms) override;
};

/// Maps transport failures and non-2xx statuses to a ProviderError message.
[[nodiscard]] std::optional<ProviderError> response_error(const HttpResponse &response);

/// Standard JSON headers plus a bearer token when `api_key` is non-empty.
[[nodiscard]] HttpHeaders json_headers(const std::string &api_key);

[[nodiscard]] std::string trim_base_url(std::string base_url);

/// choices[0].message.content of an OpenAI-compatible chat completion.
[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);

/// data[*].embedding of an OpenAI-compatible embeddings response, ordered by `index`.
[[nodiscard]] common::Result<std::vector<std::vector<float>>>
parse_openai_embeddings(const std::string &response, std::size_t expected);

} // namespace ragsync::providers
