#pragma once

#include "ragsync/common/result.hpp"
#include "ragsync/common/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragsync::knowledge {

struct KnowledgeEntry {
  std::int64_t id = 0;
  std::string tag;
  std::string question;
  std::string answer;
  bool active = true;
  common::TimePoint last_modified{};
};

/// Read side of the question/answer store the index is built from. Every failure to reach the
/// store is reported as ErrorCode::SourceUnavailable.
class IKnowledgeSource {
public:
  virtual ~IKnowledgeSource() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  /// Active rows ordered by id ascending.
  [[nodiscard]] virtual common::Result<std::vector<KnowledgeEntry>> list_active_entries() = 0;

  /// std::nullopt when no row is active.
  [[nodiscard]] virtual common::Result<std::optional<common::TimePoint>>
  max_modification_timestamp_of_active_entries() = 0;

  [[nodiscard]] virtual common::Result<std::int64_t> source_uptime_seconds() = 0;

  /// Active rows among `ids`, in no particular order. Unknown ids are skipped.
  [[nodiscard]] virtual common::Result<std::vector<KnowledgeEntry>>
  fetch_entries_by_ids(const std::vector<std::int64_t> &ids) = 0;
};

} // namespace ragsync::knowledge
