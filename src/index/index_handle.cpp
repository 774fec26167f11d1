#include "ragsync/index/index_handle.hpp"

namespace ragsync::index {

IndexHandle::IndexHandle(std::shared_ptr<const VectorIndex> initial) : current_(std::move(initial)) {}

std::shared_ptr<const VectorIndex> IndexHandle::current() const {
  return current_.load(std::memory_order_acquire);
}

void IndexHandle::publish(std::shared_ptr<const VectorIndex> index) {
  current_.store(std::move(index), std::memory_order_release);
}

std::size_t IndexHandle::size() const {
  const auto snapshot = current();
  return snapshot == nullptr ? 0 : snapshot->size();
}

} // namespace ragsync::index
