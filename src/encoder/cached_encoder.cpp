#include "ragsync/encoder/cached_encoder.hpp"

#include "ragsync/common/hash.hpp"

namespace ragsync::encoder {

CachedEncoder::CachedEncoder(std::unique_ptr<IEncoder> inner, const std::size_t capacity)
    : inner_(std::move(inner)), capacity_(capacity) {}

common::Result<Embedding> CachedEncoder::encode(const std::string_view text) {
  const std::string key = common::sha256_hex(text);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = entries_.find(key); it != entries_.end()) {
      ++hits_;
      return common::Result<Embedding>::success(it->second);
    }
    ++misses_;
  }

  auto embedded = inner_->encode(text);
  if (!embedded.ok() || capacity_ == 0) {
    return embedded;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.find(key) == entries_.end()) {
    while (entries_.size() >= capacity_ && !order_.empty()) {
      entries_.erase(order_.front());
      order_.pop_front();
    }
    entries_.emplace(key, embedded.value());
    order_.push_back(key);
  }
  return embedded;
}

common::Result<std::vector<Embedding>>
CachedEncoder::encode_batch(const std::vector<std::string> &texts) {
  return inner_->encode_batch(texts);
}

CacheStats CachedEncoder::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CacheStats{.hits = hits_, .misses = misses_, .size = entries_.size()};
}

} // namespace ragsync::encoder
