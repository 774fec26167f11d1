#pragma once

#include "ragsync/common/result.hpp"
#include "ragsync/config/schema.hpp"
#include "ragsync/providers/traits.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ragsync::encoder {

using Embedding = std::vector<float>;

/// Maps text to L2-normalized vectors of a fixed dimension. Blank input, an empty batch or an
/// unreachable model fail with ErrorCode::EncodingError.
class IEncoder {
public:
  virtual ~IEncoder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<Embedding> encode(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<Embedding>>
  encode_batch(const std::vector<std::string> &texts) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

/// Rejects blank texts and empty batches before any model call.
[[nodiscard]] common::Status validate_batch(const std::vector<std::string> &texts);

/// Checks the dimension and normalizes in place.
[[nodiscard]] common::Status finalize_embedding(Embedding &embedding, std::size_t dimensions);

[[nodiscard]] common::Result<std::unique_ptr<IEncoder>>
create_encoder(const config::Config &config,
               std::shared_ptr<providers::HttpClient> http_client = nullptr);

} // namespace ragsync::encoder
