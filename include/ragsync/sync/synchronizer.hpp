#pragma once

#include "ragsync/config/schema.hpp"
#include "ragsync/sync/clock.hpp"
#include "ragsync/sync/index_builder.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

namespace ragsync::sync {

struct SyncOptions {
  std::chrono::seconds poll_interval{60};
  std::chrono::seconds initial_delay{5};
  std::chrono::seconds source_uptime_threshold{300};
  std::chrono::seconds min_rebuild_interval{300};

  [[nodiscard]] static SyncOptions from_config(const config::SyncConfig &config);
};

enum class SyncTrigger {
  None,
  IndexAbsent,
  SourceRestarted,
  SourceModified,
};

[[nodiscard]] std::string_view trigger_name(SyncTrigger trigger);

struct PollOutcome {
  SyncTrigger trigger = SyncTrigger::None;
  bool rebuilt = false;
  bool skipped = false;
  std::string detail;
};

struct SyncStatus {
  bool active = false;
  bool rebuild_in_progress = false;
  std::optional<common::TimePoint> last_observed_modification;
  std::optional<common::TimePoint> last_rebuild_time;
  std::size_t index_size = 0;
  std::chrono::seconds poll_interval{0};
  std::chrono::seconds source_uptime_threshold{0};
  std::chrono::seconds min_rebuild_interval{0};
  bool index_file_exists = false;
};

/// Polls the knowledge source and rebuilds the index when it is missing, when the source has
/// just restarted, or when an active row changed. Triggers arriving within
/// `min_rebuild_interval` of the previous rebuild attempt are dropped.
class Synchronizer {
public:
  Synchronizer(knowledge::IKnowledgeSource &source, IndexBuilder &builder,
               index::IndexHandle &handle, SyncOptions options,
               std::shared_ptr<const SyncClock> clock = std::make_shared<SystemSyncClock>());
  ~Synchronizer();

  Synchronizer(const Synchronizer &) = delete;
  Synchronizer &operator=(const Synchronizer &) = delete;

  void start();
  /// Returns once the current poll, including any rebuild, has finished.
  void stop();
  [[nodiscard]] bool is_running() const { return running_.load(); }

  PollOutcome poll_once();

  /// Synchronous rebuild that ignores the anti-thrash guard.
  [[nodiscard]] common::Result<RebuildStats> force_rebuild();

  [[nodiscard]] SyncStatus status() const;
  [[nodiscard]] const SyncOptions &options() const { return options_; }

private:
  void loop();
  bool sleep_while_running(std::chrono::seconds duration);
  [[nodiscard]] std::optional<SyncTrigger> evaluate_triggers(PollOutcome &outcome);
  void seed_baseline();
  void run_rebuild(SyncTrigger trigger, PollOutcome &outcome);
  void set_observed(std::optional<common::TimePoint> value);
  void set_last_rebuild(common::TimePoint value);

  knowledge::IKnowledgeSource &source_;
  IndexBuilder &builder_;
  index::IndexHandle &handle_;
  SyncOptions options_;
  std::shared_ptr<const SyncClock> clock_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::mutex poll_mutex_;

  // Guarded by poll_mutex_.
  std::optional<common::TimePoint> last_seen_modification_;
  std::optional<common::TimePoint> last_rebuild_attempt_;

  mutable std::mutex snapshot_mutex_;
  std::optional<common::TimePoint> observed_snapshot_;
  std::optional<common::TimePoint> last_rebuild_snapshot_;
};

} // namespace ragsync::sync
