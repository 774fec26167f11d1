#pragma once

#include "ragsync/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace ragsync::index {

/// Position returned for slots that do not resolve to a source row.
inline constexpr std::int64_t kInvalidId = -1;

struct SearchResult {
  std::vector<float> scores;
  std::vector<std::int64_t> positions;

  [[nodiscard]] bool empty() const { return positions.empty(); }
};

struct IndexStats {
  std::size_t count = 0;
  std::size_t dimension = 0;
  std::uint64_t size_bytes = 0;
};

/// Exact inner-product index over L2-normalized vectors plus the position -> source id mapping.
/// Persisted as a structure file `<path>` and a mapping file `<path>.ids.json`. The structure
/// header records the SHA-256 of the mapping text, so a pair from different saves is rejected.
class VectorIndex {
public:
  [[nodiscard]] static VectorIndex create_empty(std::size_t dimension);

  /// Absent, unreadable or corrupt artifacts, or ones built for another dimension, yield
  /// std::nullopt. The reason is logged.
  [[nodiscard]] static std::optional<VectorIndex> load(const std::filesystem::path &path,
                                                       std::size_t dimension);

  [[nodiscard]] static std::filesystem::path mapping_path(const std::filesystem::path &path);

  /// Fails with DimensionMismatch on a wrong length and InvalidArgument when the query cannot
  /// be normalized (zero or non-finite).
  [[nodiscard]] common::Result<SearchResult> search(const std::vector<float> &query,
                                                    std::size_t k) const;

  [[nodiscard]] common::Status add(const std::vector<std::vector<float>> &vectors,
                                   const std::vector<std::int64_t> &ids);

  /// Both files are written to temporaries and fsynced before either is renamed into place.
  [[nodiscard]] common::Status save(const std::filesystem::path &path) const;

  [[nodiscard]] std::vector<std::int64_t>
  map_to_source_ids(const std::vector<std::int64_t> &positions) const;

  [[nodiscard]] std::size_t size() const { return id_mapping_.size(); }
  [[nodiscard]] std::size_t dimension() const { return dimension_; }
  [[nodiscard]] bool empty() const { return id_mapping_.empty(); }
  [[nodiscard]] const std::vector<std::int64_t> &id_mapping() const { return id_mapping_; }
  [[nodiscard]] IndexStats stats() const;

private:
  explicit VectorIndex(std::size_t dimension);

  [[nodiscard]] std::string serialize_structure(const std::string &mapping_text) const;

  std::size_t dimension_;
  std::vector<float> data_;
  std::vector<std::int64_t> id_mapping_;
};

} // namespace ragsync::index
