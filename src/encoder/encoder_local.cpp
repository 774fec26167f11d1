#include "ragsync/encoder/encoder_local.hpp"

#include "ragsync/common/fs.hpp"

#include <cctype>
#include <cstdint>

namespace ragsync::encoder {

namespace {

constexpr float kWordWeight = 1.0F;
constexpr float kBigramWeight = 0.5F;
constexpr float kTrigramWeight = 0.25F;

std::uint64_t fnv1a(const std::string_view text) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::vector<std::string> split_words(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || uch >= 0x80) {
      current.push_back(static_cast<char>(std::tolower(uch)));
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

} // namespace

LocalEncoder::LocalEncoder(const std::size_t dimensions) : dimensions_(dimensions) {}

std::string_view LocalEncoder::name() const { return "local"; }

common::Result<Embedding> LocalEncoder::encode(const std::string_view text) {
  const std::string trimmed = common::trim(std::string(text));
  if (trimmed.empty()) {
    return common::Result<Embedding>::failure(common::ErrorCode::EncodingError,
                                              "cannot encode blank text");
  }
  if (dimensions_ == 0) {
    return common::Result<Embedding>::failure(common::ErrorCode::EncodingError,
                                              "encoder dimension is 0");
  }

  Embedding values(dimensions_, 0.0F);
  const auto add_feature = [&](const std::string &feature, const float weight) {
    const std::uint64_t hash = fnv1a(feature);
    const float sign = (hash >> 63U) != 0 ? -1.0F : 1.0F;
    values[hash % dimensions_] += sign * weight;
  };

  const auto words = split_words(trimmed);
  if (words.empty()) {
    add_feature("t:" + trimmed, kWordWeight);
  }
  for (std::size_t i = 0; i < words.size(); ++i) {
    add_feature("w:" + words[i], kWordWeight);
    if (i + 1 < words.size()) {
      add_feature("b:" + words[i] + " " + words[i + 1], kBigramWeight);
    }
    const std::string padded = " " + words[i] + " ";
    for (std::size_t j = 0; j + 3 <= padded.size(); ++j) {
      add_feature("c:" + padded.substr(j, 3), kTrigramWeight);
    }
  }

  if (const auto status = finalize_embedding(values, dimensions_); !status.ok()) {
    return common::Result<Embedding>::failure(status);
  }
  return common::Result<Embedding>::success(std::move(values));
}

common::Result<std::vector<Embedding>>
LocalEncoder::encode_batch(const std::vector<std::string> &texts) {
  if (const auto status = validate_batch(texts); !status.ok()) {
    return common::Result<std::vector<Embedding>>::failure(status);
  }

  std::vector<Embedding> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = encode(text);
    if (!emb.ok()) {
      return emb.forward_failure<std::vector<Embedding>>();
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<Embedding>>::success(std::move(out));
}

std::size_t LocalEncoder::dimensions() const { return dimensions_; }

} // namespace ragsync::encoder
