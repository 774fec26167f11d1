#pragma once

#include "ragsync/encoder/encoder.hpp"
#include "ragsync/providers/traits.hpp"

namespace ragsync::encoder {

struct OpenAiEncoderOptions {
  std::string base_url;
  std::string api_key;
  std::string model;
  std::size_t dimensions = 0;
  std::size_t batch_size = 32;
  std::uint64_t timeout_ms = 30'000;
};

/// Client for an OpenAI-compatible `/embeddings` endpoint.
class OpenAiEncoder final : public IEncoder {
public:
  explicit OpenAiEncoder(OpenAiEncoderOptions options,
                         std::shared_ptr<providers::HttpClient> http_client =
                             std::make_shared<providers::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<Embedding> encode(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<Embedding>>
  encode_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  [[nodiscard]] common::Result<std::vector<Embedding>>
  request_slice(const std::vector<std::string> &texts, std::size_t begin, std::size_t end);

  OpenAiEncoderOptions options_;
  std::shared_ptr<providers::HttpClient> http_client_;
};

} // namespace ragsync::encoder
