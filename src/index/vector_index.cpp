#include "ragsync/index/vector_index.hpp"

#include "ragsync/common/fs.hpp"
#include "ragsync/common/hash.hpp"
#include "ragsync/common/json_util.hpp"
#include "ragsync/common/vector_math.hpp"
#include "ragsync/observability/global.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <numeric>

namespace ragsync::index {

namespace {

constexpr char kMagic[4] = {'R', 'S', 'V', 'I'};
constexpr std::uint32_t kFormatVersion = 2;
constexpr std::size_t kChecksumSize = 64;
// magic, version, dimension, count, SHA-256 of the mapping file text
constexpr std::size_t kHeaderSize =
    sizeof(kMagic) + sizeof(std::uint32_t) + 2 * sizeof(std::uint64_t) + kChecksumSize;
constexpr const char *kMappingSuffix = ".ids.json";

template <typename T> void append_pod(std::string &out, const T &value) {
  char bytes[sizeof(T)];
  std::memcpy(bytes, &value, sizeof(T));
  out.append(bytes, sizeof(T));
}

template <typename T> T read_pod(const std::string &in, const std::size_t offset) {
  T value{};
  std::memcpy(&value, in.data() + offset, sizeof(T));
  return value;
}

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

std::optional<VectorIndex> absent(const std::filesystem::path &path, const std::string &reason) {
  observability::record_warning("index", "ignoring index at " + path.string() + ": " + reason);
  return std::nullopt;
}

} // namespace

VectorIndex::VectorIndex(const std::size_t dimension) : dimension_(dimension) {}

VectorIndex VectorIndex::create_empty(const std::size_t dimension) { return VectorIndex(dimension); }

std::filesystem::path VectorIndex::mapping_path(const std::filesystem::path &path) {
  std::filesystem::path mapping = path;
  mapping += kMappingSuffix;
  return mapping;
}

common::Result<SearchResult> VectorIndex::search(const std::vector<float> &query,
                                                 const std::size_t k) const {
  if (query.size() != dimension_) {
    return common::Result<SearchResult>::failure(
        common::ErrorCode::DimensionMismatch, "query has dimension " + std::to_string(query.size()) +
                                                  ", index expects " + std::to_string(dimension_));
  }

  const std::size_t count = size();
  const std::size_t limit = std::min(k, count);
  if (limit == 0) {
    return common::Result<SearchResult>::success(SearchResult{});
  }

  std::vector<float> normalized = query;
  if (!common::l2_normalize(normalized)) {
    return common::Result<SearchResult>::failure(
        common::ErrorCode::InvalidArgument, "query vector is zero or not finite");
  }

  std::vector<float> scores(count);
  for (std::size_t i = 0; i < count; ++i) {
    scores[i] = common::dot(normalized.data(), data_.data() + i * dimension_, dimension_);
  }

  std::vector<std::size_t> order(count);
  std::iota(order.begin(), order.end(), 0);
  std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(limit), order.end(),
                    [&](const std::size_t lhs, const std::size_t rhs) {
                      if (scores[lhs] != scores[rhs]) {
                        return scores[lhs] > scores[rhs];
                      }
                      return lhs < rhs;
                    });

  SearchResult result;
  result.scores.reserve(limit);
  result.positions.reserve(limit);
  for (std::size_t i = 0; i < limit; ++i) {
    result.scores.push_back(scores[order[i]]);
    result.positions.push_back(static_cast<std::int64_t>(order[i]));
  }
  return common::Result<SearchResult>::success(std::move(result));
}

common::Status VectorIndex::add(const std::vector<std::vector<float>> &vectors,
                                const std::vector<std::int64_t> &ids) {
  if (vectors.size() != ids.size()) {
    return common::Status::error(common::ErrorCode::LengthMismatch,
                                 std::to_string(vectors.size()) + " vectors but " +
                                     std::to_string(ids.size()) + " ids");
  }
  for (std::size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dimension_) {
      return common::Status::error(common::ErrorCode::DimensionMismatch,
                                   "vector " + std::to_string(i) + " has dimension " +
                                       std::to_string(vectors[i].size()) + ", index expects " +
                                       std::to_string(dimension_));
    }
    const double norm = common::l2_norm(vectors[i].data(), vectors[i].size());
    if (!std::isfinite(norm) || norm <= 0.0) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "vector " + std::to_string(i) + " cannot be normalized");
    }
  }

  data_.reserve(data_.size() + vectors.size() * dimension_);
  id_mapping_.reserve(id_mapping_.size() + ids.size());
  for (std::size_t i = 0; i < vectors.size(); ++i) {
    const std::size_t offset = data_.size();
    data_.insert(data_.end(), vectors[i].begin(), vectors[i].end());
    common::l2_normalize(data_.data() + offset, dimension_);
    id_mapping_.push_back(ids[i]);
  }
  return common::Status::success();
}

std::vector<std::int64_t>
VectorIndex::map_to_source_ids(const std::vector<std::int64_t> &positions) const {
  std::vector<std::int64_t> out;
  out.reserve(positions.size());
  for (const auto position : positions) {
    if (position < 0 || static_cast<std::size_t>(position) >= id_mapping_.size()) {
      out.push_back(kInvalidId);
    } else {
      out.push_back(id_mapping_[static_cast<std::size_t>(position)]);
    }
  }
  return out;
}

IndexStats VectorIndex::stats() const {
  return IndexStats{.count = size(),
                    .dimension = dimension_,
                    .size_bytes = kHeaderSize + data_.size() * sizeof(float) + kChecksumSize};
}

std::string VectorIndex::serialize_structure(const std::string &mapping_text) const {
  std::string out;
  out.reserve(kHeaderSize + data_.size() * sizeof(float) + kChecksumSize);
  out.append(kMagic, sizeof(kMagic));
  append_pod(out, kFormatVersion);
  append_pod(out, static_cast<std::uint64_t>(dimension_));
  append_pod(out, static_cast<std::uint64_t>(size()));
  out += common::sha256_hex(mapping_text);

  const std::size_t payload_bytes = data_.size() * sizeof(float);
  out.append(reinterpret_cast<const char *>(data_.data()), payload_bytes);
  out += common::sha256_hex(data_.data(), payload_bytes);
  return out;
}

common::Status VectorIndex::save(const std::filesystem::path &path) const {
  if (path.has_parent_path()) {
    if (const auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return dir.status();
    }
  }
  const auto mapping = mapping_path(path);
  const std::string mapping_text = common::json_int_array(id_mapping_);

  const auto structure_tmp = common::write_temp_sibling(path, serialize_structure(mapping_text));
  if (!structure_tmp.ok()) {
    return structure_tmp.status();
  }
  const auto mapping_tmp = common::write_temp_sibling(mapping, mapping_text);
  if (!mapping_tmp.ok()) {
    remove_quietly(structure_tmp.value());
    return mapping_tmp.status();
  }

  std::error_code ec;
  std::filesystem::rename(structure_tmp.value(), path, ec);
  if (ec) {
    remove_quietly(structure_tmp.value());
    remove_quietly(mapping_tmp.value());
    return common::Status::error(common::ErrorCode::IoError,
                                 "failed to move index into place: " + ec.message());
  }
  std::filesystem::rename(mapping_tmp.value(), mapping, ec);
  if (ec) {
    remove_quietly(mapping_tmp.value());
    return common::Status::error(common::ErrorCode::IoError,
                                 "failed to move id mapping into place: " + ec.message());
  }
  if (path.has_parent_path()) {
    return common::sync_path(path.parent_path());
  }
  return common::Status::success();
}

std::optional<VectorIndex> VectorIndex::load(const std::filesystem::path &path,
                                             const std::size_t dimension) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    observability::record_info("index", "no index at " + path.string());
    return std::nullopt;
  }
  const auto mapping = mapping_path(path);
  if (!std::filesystem::exists(mapping, ec)) {
    return absent(path, "id mapping " + mapping.string() + " is missing");
  }

  const auto structure = common::read_file(path);
  if (!structure.ok()) {
    return absent(path, structure.error());
  }
  const std::string &bytes = structure.value();
  if (bytes.size() < kHeaderSize + kChecksumSize ||
      std::memcmp(bytes.data(), kMagic, sizeof(kMagic)) != 0) {
    return absent(path, "not an index file");
  }

  std::size_t offset = sizeof(kMagic);
  const auto version = read_pod<std::uint32_t>(bytes, offset);
  offset += sizeof(std::uint32_t);
  const auto stored_dimension = read_pod<std::uint64_t>(bytes, offset);
  offset += sizeof(std::uint64_t);
  const auto count = read_pod<std::uint64_t>(bytes, offset);
  offset += sizeof(std::uint64_t);
  const std::string mapping_checksum = bytes.substr(offset, kChecksumSize);

  if (version != kFormatVersion) {
    return absent(path, "unsupported format version " + std::to_string(version));
  }
  if (stored_dimension != dimension) {
    return absent(path, "built for dimension " + std::to_string(stored_dimension) +
                            ", configured " + std::to_string(dimension));
  }
  if (dimension != 0 && count > (bytes.size() / sizeof(float)) / dimension) {
    return absent(path, "truncated payload");
  }
  const std::size_t payload_bytes = static_cast<std::size_t>(count) * dimension * sizeof(float);
  if (bytes.size() != kHeaderSize + payload_bytes + kChecksumSize) {
    return absent(path, "truncated payload");
  }

  const std::string stored_checksum = bytes.substr(kHeaderSize + payload_bytes, kChecksumSize);
  if (common::sha256_hex(bytes.data() + kHeaderSize, payload_bytes) != stored_checksum) {
    return absent(path, "checksum mismatch");
  }

  const auto mapping_text = common::read_file(mapping);
  if (!mapping_text.ok()) {
    return absent(path, mapping_text.error());
  }
  // A crash between the two renames leaves a structure beside a mapping from another save.
  if (common::sha256_hex(mapping_text.value()) != mapping_checksum) {
    return absent(path, "id mapping " + mapping.string() + " belongs to a different save");
  }
  auto ids = common::json_parse_int_array(mapping_text.value());
  if (!ids.ok()) {
    return absent(path, "id mapping is malformed: " + ids.error());
  }
  if (ids.value().size() != count) {
    return absent(path, "id mapping has " + std::to_string(ids.value().size()) +
                            " entries, index has " + std::to_string(count));
  }

  VectorIndex index(dimension);
  index.data_.resize(static_cast<std::size_t>(count) * dimension);
  std::memcpy(index.data_.data(), bytes.data() + kHeaderSize, payload_bytes);
  index.id_mapping_ = std::move(ids.value());
  return index;
}

} // namespace ragsync::index
