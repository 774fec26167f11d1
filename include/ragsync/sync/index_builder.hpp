#pragma once

#include "ragsync/common/result.hpp"
#include "ragsync/encoder/encoder.hpp"
#include "ragsync/index/index_handle.hpp"
#include "ragsync/knowledge/knowledge_source.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>

namespace ragsync::sync {

struct RebuildStats {
  std::size_t count = 0;
  std::chrono::milliseconds duration{0};
  std::uint64_t size_bytes = 0;
};

/// Rebuilds the index from every active source row, saves it and publishes it. Concurrent calls
/// are serialized; a failed rebuild leaves the published index untouched.
class IndexBuilder {
public:
  IndexBuilder(knowledge::IKnowledgeSource &source, encoder::IEncoder &encoder,
               index::IndexHandle &handle, std::filesystem::path index_path,
               std::size_t dimension);

  [[nodiscard]] common::Result<RebuildStats> rebuild(const std::string &reason);
  [[nodiscard]] bool in_progress() const { return in_progress_.load(); }
  [[nodiscard]] const std::filesystem::path &index_path() const { return index_path_; }

  /// Text encoded for a row: question and answer joined by one space.
  [[nodiscard]] static std::string document_text(const knowledge::KnowledgeEntry &entry);

private:
  [[nodiscard]] common::Result<RebuildStats> rebuild_locked();

  knowledge::IKnowledgeSource &source_;
  encoder::IEncoder &encoder_;
  index::IndexHandle &handle_;
  std::filesystem::path index_path_;
  std::size_t dimension_;

  std::mutex mutex_;
  std::atomic<bool> in_progress_{false};
};

} // namespace ragsync::sync
