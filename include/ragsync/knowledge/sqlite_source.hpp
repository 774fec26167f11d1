#pragma once

#include "ragsync/knowledge/knowledge_source.hpp"

#include <filesystem>
#include <functional>

namespace ragsync::knowledge {

struct EntryUpdate {
  std::optional<std::string> tag;
  std::optional<std::string> question;
  std::optional<std::string> answer;
};

/// SQLite-backed knowledge store. Each call opens its own connection so the synchronizer thread
/// and request threads never share a handle.
class SqliteKnowledgeSource final : public IKnowledgeSource {
public:
  using Clock = std::function<common::TimePoint()>;

  static constexpr std::size_t kMinQuestionLength = 3;

  SqliteKnowledgeSource(std::filesystem::path db_path, std::uint64_t busy_timeout_ms,
                        Clock clock = [] { return std::chrono::system_clock::now(); });

  /// Creates the schema and records the start time if this is a fresh store.
  [[nodiscard]] common::Status initialize();

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] common::Result<std::vector<KnowledgeEntry>> list_active_entries() override;
  [[nodiscard]] common::Result<std::optional<common::TimePoint>>
  max_modification_timestamp_of_active_entries() override;
  [[nodiscard]] common::Result<std::int64_t> source_uptime_seconds() override;
  [[nodiscard]] common::Result<std::vector<KnowledgeEntry>>
  fetch_entries_by_ids(const std::vector<std::int64_t> &ids) override;

  [[nodiscard]] common::Result<std::int64_t> add_entry(const std::string &tag,
                                                       const std::string &question,
                                                       const std::string &answer);
  [[nodiscard]] common::Status update_entry(std::int64_t id, const EntryUpdate &update);
  [[nodiscard]] common::Status set_active(std::int64_t id, bool active);
  [[nodiscard]] common::Result<std::vector<KnowledgeEntry>> list_entries(bool include_inactive);
  [[nodiscard]] common::Result<std::optional<KnowledgeEntry>> get_entry(std::int64_t id);

  /// Resets the start time, which the synchronizer reads as a source restart.
  [[nodiscard]] common::Status mark_restarted();

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  std::filesystem::path db_path_;
  std::uint64_t busy_timeout_ms_;
  Clock clock_;
};

} // namespace ragsync::knowledge
