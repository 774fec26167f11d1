#pragma once

#include "ragsync/index/vector_index.hpp"

#include <atomic>
#include <memory>

namespace ragsync::index {

/// Publication point for the live index. Readers take a snapshot and never block the writer;
/// a replaced index stays alive until its last reader releases it.
class IndexHandle {
public:
  IndexHandle() = default;
  explicit IndexHandle(std::shared_ptr<const VectorIndex> initial);

  IndexHandle(const IndexHandle &) = delete;
  IndexHandle &operator=(const IndexHandle &) = delete;

  [[nodiscard]] std::shared_ptr<const VectorIndex> current() const;
  void publish(std::shared_ptr<const VectorIndex> index);

  /// Vector count of the current snapshot, 0 when nothing is published.
  [[nodiscard]] std::size_t size() const;

private:
  std::atomic<std::shared_ptr<const VectorIndex>> current_;
};

} // namespace ragsync::index
