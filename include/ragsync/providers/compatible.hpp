#pragma once

#include "ragsync/providers/traits.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ragsync::providers {

struct ChatMessage {
  std::string role;
  std::string content;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  double temperature = 0.7;
  std::optional<std::uint32_t> max_tokens;
  std::uint64_t timeout_ms = 30'000;
};

/// Chat client for any server speaking the OpenAI `/chat/completions` protocol.
class CompatibleChatProvider {
public:
  CompatibleChatProvider(std::string base_url, std::string api_key,
                         std::shared_ptr<HttpClient> http_client =
                             std::make_shared<CurlHttpClient>());

  [[nodiscard]] common::Result<std::string> chat(const ChatRequest &request);

  /// HEAD against the base URL. Any HTTP answer counts as reachable.
  [[nodiscard]] common::Status warmup(std::uint64_t timeout_ms);

  [[nodiscard]] const std::string &base_url() const { return base_url_; }

private:
  [[nodiscard]] static std::string build_body(const ChatRequest &request);

  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace ragsync::providers
