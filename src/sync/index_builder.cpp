#include "ragsync/sync/index_builder.hpp"

#include "ragsync/observability/global.hpp"

namespace ragsync::sync {

namespace {

class InProgressGuard {
public:
  explicit InProgressGuard(std::atomic<bool> &flag) : flag_(flag) { flag_.store(true); }
  ~InProgressGuard() { flag_.store(false); }

  InProgressGuard(const InProgressGuard &) = delete;
  InProgressGuard &operator=(const InProgressGuard &) = delete;

private:
  std::atomic<bool> &flag_;
};

} // namespace

IndexBuilder::IndexBuilder(knowledge::IKnowledgeSource &source, encoder::IEncoder &encoder,
                           index::IndexHandle &handle, std::filesystem::path index_path,
                           const std::size_t dimension)
    : source_(source), encoder_(encoder), handle_(handle), index_path_(std::move(index_path)),
      dimension_(dimension) {}

std::string IndexBuilder::document_text(const knowledge::KnowledgeEntry &entry) {
  return entry.question + " " + entry.answer;
}

common::Result<RebuildStats> IndexBuilder::rebuild(const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  InProgressGuard guard(in_progress_);

  observability::record_event(observability::RebuildStartEvent{.reason = reason});
  const auto started = std::chrono::steady_clock::now();
  auto result = rebuild_locked();
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (!result.ok()) {
    observability::record_event(observability::RebuildEndEvent{
        .reason = reason, .success = false, .duration = elapsed, .error = result.error()});
    return result;
  }

  result.value().duration = elapsed;
  observability::record_event(observability::RebuildEndEvent{.reason = reason,
                                                             .success = true,
                                                             .entries = result.value().count,
                                                             .duration = elapsed});
  observability::record_metric(observability::IndexSizeMetric{.vectors = result.value().count});
  return result;
}

common::Result<RebuildStats> IndexBuilder::rebuild_locked() {
  auto entries = source_.list_active_entries();
  if (!entries.ok()) {
    return entries.forward_failure<RebuildStats>();
  }

  auto built = index::VectorIndex::create_empty(dimension_);
  if (entries.value().empty()) {
    observability::record_warning("sync", "knowledge source has no active entries; "
                                          "publishing an empty index");
  } else {
    std::vector<std::string> texts;
    std::vector<std::int64_t> ids;
    texts.reserve(entries.value().size());
    ids.reserve(entries.value().size());
    for (const auto &entry : entries.value()) {
      texts.push_back(document_text(entry));
      ids.push_back(entry.id);
    }

    auto vectors = encoder_.encode_batch(texts);
    if (!vectors.ok()) {
      return vectors.forward_failure<RebuildStats>();
    }
    if (auto status = built.add(vectors.value(), ids); !status.ok()) {
      return common::Result<RebuildStats>::failure(status);
    }
  }

  if (auto status = built.save(index_path_); !status.ok()) {
    return common::Result<RebuildStats>::failure(status);
  }

  const auto stats = built.stats();
  handle_.publish(std::make_shared<const index::VectorIndex>(std::move(built)));
  return common::Result<RebuildStats>::success(
      RebuildStats{.count = stats.count, .size_bytes = stats.size_bytes});
}

} // namespace ragsync::sync
