#include "ragsync/providers/compatible.hpp"

#include "ragsync/common/json_util.hpp"

#include <sstream>

namespace ragsync::providers {

CompatibleChatProvider::CompatibleChatProvider(std::string base_url, std::string api_key,
                                               std::shared_ptr<HttpClient> http_client)
    : base_url_(trim_base_url(std::move(base_url))), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)) {}

std::string CompatibleChatProvider::build_body(const ChatRequest &request) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(request.model) << "\",";
  body << "\"messages\":[";
  for (std::size_t i = 0; i < request.messages.size(); ++i) {
    if (i > 0) {
      body << ',';
    }
    body << "{\"role\":\"" << common::json_escape(request.messages[i].role)
         << "\",\"content\":\"" << common::json_escape(request.messages[i].content) << "\"}";
  }
  body << "],";
  if (request.max_tokens.has_value()) {
    body << "\"max_tokens\":" << *request.max_tokens << ",";
  }
  body << "\"temperature\":" << request.temperature << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Result<std::string> CompatibleChatProvider::chat(const ChatRequest &request) {
  const auto response = http_client_->post_json(base_url_ + "/chat/completions",
                                                json_headers(api_key_), build_body(request),
                                                request.timeout_ms);
  if (const auto error = response_error(response); error.has_value()) {
    return common::Result<std::string>::failure(common::ErrorCode::GenerationError,
                                                error->to_string());
  }

  auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return common::Result<std::string>::failure(
        common::ErrorCode::GenerationError,
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()}
            .to_string());
  }
  return parsed;
}

common::Status CompatibleChatProvider::warmup(const std::uint64_t timeout_ms) {
  const auto response = http_client_->head(base_url_, {}, timeout_ms);
  if (response.network_error || response.timeout) {
    return common::Status::error(
        common::ErrorCode::GenerationError,
        ProviderError{.code = response.timeout ? ProviderErrorCode::Timeout
                                               : ProviderErrorCode::NetworkError,
                      .message = response.network_error_message}
            .to_string());
  }
  return common::Status::success();
}

} // namespace ragsync::providers
