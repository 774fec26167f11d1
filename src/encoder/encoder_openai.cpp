#include "ragsync/encoder/encoder_openai.hpp"

#include "ragsync/common/fs.hpp"
#include "ragsync/common/json_util.hpp"

#include <algorithm>
#include <sstream>

namespace ragsync::encoder {

OpenAiEncoder::OpenAiEncoder(OpenAiEncoderOptions options,
                             std::shared_ptr<providers::HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
  options_.base_url = providers::trim_base_url(std::move(options_.base_url));
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
}

std::string_view OpenAiEncoder::name() const { return "openai"; }

common::Result<Embedding> OpenAiEncoder::encode(const std::string_view text) {
  auto batch = encode_batch({std::string(text)});
  if (!batch.ok()) {
    return batch.forward_failure<Embedding>();
  }
  return common::Result<Embedding>::success(std::move(batch.value().front()));
}

common::Result<std::vector<Embedding>>
OpenAiEncoder::encode_batch(const std::vector<std::string> &texts) {
  if (const auto status = validate_batch(texts); !status.ok()) {
    return common::Result<std::vector<Embedding>>::failure(status);
  }

  std::vector<Embedding> out;
  out.reserve(texts.size());
  for (std::size_t begin = 0; begin < texts.size(); begin += options_.batch_size) {
    const std::size_t end = std::min(texts.size(), begin + options_.batch_size);
    auto slice = request_slice(texts, begin, end);
    if (!slice.ok()) {
      return slice;
    }
    for (auto &embedding : slice.value()) {
      out.push_back(std::move(embedding));
    }
  }
  return common::Result<std::vector<Embedding>>::success(std::move(out));
}

common::Result<std::vector<Embedding>>
OpenAiEncoder::request_slice(const std::vector<std::string> &texts, const std::size_t begin,
                             const std::size_t end) {
  using ResultT = common::Result<std::vector<Embedding>>;

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(options_.model) << "\",";
  body << "\"input\":[";
  for (std::size_t i = begin; i < end; ++i) {
    if (i > begin) {
      body << ',';
    }
    body << "\"" << common::json_escape(texts[i]) << "\"";
  }
  body << "]";
  body << "}";

  const auto response =
      http_client_->post_json(options_.base_url + "/embeddings",
                              providers::json_headers(options_.api_key), body.str(),
                              options_.timeout_ms);
  if (const auto error = providers::response_error(response); error.has_value()) {
    return ResultT::failure(common::ErrorCode::EncodingError, error->to_string());
  }

  auto parsed = providers::parse_openai_embeddings(response.body, end - begin);
  if (!parsed.ok()) {
    return ResultT::failure(
        common::ErrorCode::EncodingError,
        providers::ProviderError{.code = providers::ProviderErrorCode::InvalidResponse,
                                 .message = parsed.error()}
            .to_string());
  }

  for (auto &embedding : parsed.value()) {
    if (const auto status = finalize_embedding(embedding, options_.dimensions); !status.ok()) {
      return ResultT::failure(status);
    }
  }
  return parsed;
}

std::size_t OpenAiEncoder::dimensions() const { return options_.dimensions; }

} // namespace ragsync::encoder
