#pragma once

#include "ragsync/encoder/encoder.hpp"

namespace ragsync::encoder {

/// Feature-hashing encoder: words, word bigrams and character trigrams are hashed into
/// `dimensions` signed buckets. Deterministic and model-free.
class LocalEncoder final : public IEncoder {
public:
  explicit LocalEncoder(std::size_t dimensions);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<Embedding> encode(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<Embedding>>
  encode_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::size_t dimensions_;
};

} // namespace ragsync::encoder
