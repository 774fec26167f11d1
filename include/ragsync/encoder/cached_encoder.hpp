#pragma once

#include "ragsync/encoder/encoder.hpp"

#include <deque>
#include <mutex>
#include <unordered_map>

namespace ragsync::encoder {

struct CacheStats {
  std::size_t hits = 0;
  std::size_t misses = 0;
  std::size_t size = 0;
};

/// Memoizes single-text encodes keyed by SHA-256 of the text, evicting oldest first.
/// Batch encodes pass straight through.
class CachedEncoder final : public IEncoder {
public:
  CachedEncoder(std::unique_ptr<IEncoder> inner, std::size_t capacity);

  [[nodiscard]] std::string_view name() const override { return inner_->name(); }
  [[nodiscard]] common::Result<Embedding> encode(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<Embedding>>
  encode_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return inner_->dimensions(); }

  [[nodiscard]] CacheStats stats() const;

private:
  std::unique_ptr<IEncoder> inner_;
  std::size_t capacity_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Embedding> entries_;
  std::deque<std::string> order_;
  std::size_t hits_ = 0;
  std::size_t misses_ = 0;
};

} // namespace ragsync::encoder
