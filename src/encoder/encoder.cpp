#include "ragsync/encoder/encoder.hpp"

#include "ragsync/common/fs.hpp"
#include "ragsync/common/vector_math.hpp"
#include "ragsync/encoder/cached_encoder.hpp"
#include "ragsync/encoder/encoder_local.hpp"
#include "ragsync/encoder/encoder_openai.hpp"

namespace ragsync::encoder {

common::Status validate_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return common::Status::error(common::ErrorCode::EncodingError, "cannot encode an empty batch");
  }
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (common::trim(texts[i]).empty()) {
      return common::Status::error(common::ErrorCode::EncodingError,
                                   "cannot encode blank text at position " + std::to_string(i));
    }
  }
  return common::Status::success();
}

common::Status finalize_embedding(Embedding &embedding, const std::size_t dimensions) {
  if (embedding.size() != dimensions) {
    return common::Status::error(common::ErrorCode::EncodingError,
                                 "model returned dimension " + std::to_string(embedding.size()) +
                                     ", expected " + std::to_string(dimensions));
  }
  if (!common::l2_normalize(embedding)) {
    return common::Status::error(common::ErrorCode::EncodingError,
                                 "model returned a zero-norm embedding");
  }
  return common::Status::success();
}

common::Result<std::unique_ptr<IEncoder>>
create_encoder(const config::Config &config, std::shared_ptr<providers::HttpClient> http_client) {
  using ResultT = common::Result<std::unique_ptr<IEncoder>>;

  std::unique_ptr<IEncoder> encoder;
  const std::string provider = common::to_lower(common::trim(config.encoder.provider));
  if (provider == "local") {
    encoder = std::make_unique<LocalEncoder>(config.index.dimension);
  } else if (provider == "openai") {
    if (http_client == nullptr) {
      http_client = std::make_shared<providers::CurlHttpClient>();
    }
    encoder = std::make_unique<OpenAiEncoder>(
        OpenAiEncoderOptions{.base_url = config.encoder.base_url,
                             .api_key = config.encoder.api_key.value_or(""),
                             .model = config.encoder.model,
                             .dimensions = config.index.dimension,
                             .batch_size = config.encoder.batch_size,
                             .timeout_ms = config.encoder.timeout_ms},
        std::move(http_client));
  } else {
    return ResultT::failure(common::ErrorCode::ConfigError,
                            "Unknown encoder.provider: " + config.encoder.provider);
  }

  if (config.encoder.cache_capacity > 0) {
    encoder = std::make_unique<CachedEncoder>(std::move(encoder), config.encoder.cache_capacity);
  }
  return ResultT::success(std::move(encoder));
}

} // namespace ragsync::encoder
