#include "ragsync/sync/synchronizer.hpp"

#include "ragsync/observability/global.hpp"

#include <filesystem>

namespace ragsync::sync {

namespace {

constexpr auto kSleepStep = std::chrono::milliseconds(100);

} // namespace

SyncOptions SyncOptions::from_config(const config::SyncConfig &config) {
  return SyncOptions{
      .poll_interval = std::chrono::seconds(config.poll_interval_seconds),
      .initial_delay = std::chrono::seconds(config.initial_delay_seconds),
      .source_uptime_threshold = std::chrono::seconds(config.source_uptime_threshold_seconds),
      .min_rebuild_interval = std::chrono::seconds(config.min_rebuild_interval_seconds),
  };
}

std::string_view trigger_name(const SyncTrigger trigger) {
  switch (trigger) {
  case SyncTrigger::None:
    return "none";
  case SyncTrigger::IndexAbsent:
    return "index_absent";
  case SyncTrigger::SourceRestarted:
    return "source_restarted";
  case SyncTrigger::SourceModified:
    return "source_modified";
  }
  return "unknown";
}

Synchronizer::Synchronizer(knowledge::IKnowledgeSource &source, IndexBuilder &builder,
                           index::IndexHandle &handle, SyncOptions options,
                           std::shared_ptr<const SyncClock> clock)
    : source_(source), builder_(builder), handle_(handle), options_(options),
      clock_(std::move(clock)) {}

Synchronizer::~Synchronizer() { stop(); }

void Synchronizer::start() {
  if (running_) {
    return;
  }
  running_ = true;
  observability::record_info(
      "sync", "synchronizer started (poll every " + std::to_string(options_.poll_interval.count()) +
                  "s, min rebuild interval " +
                  std::to_string(options_.min_rebuild_interval.count()) + "s)");
  thread_ = std::thread([this]() { loop(); });
}

void Synchronizer::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
    observability::record_info("sync", "synchronizer stopped");
  }
}

bool Synchronizer::sleep_while_running(const std::chrono::seconds duration) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (running_ && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kSleepStep);
  }
  return running_;
}

void Synchronizer::loop() {
  if (!sleep_while_running(options_.initial_delay)) {
    return;
  }
  (void)poll_once();
  while (sleep_while_running(options_.poll_interval)) {
    (void)poll_once();
  }
}

PollOutcome Synchronizer::poll_once() {
  std::lock_guard<std::mutex> lock(poll_mutex_);
  PollOutcome outcome;

  if (builder_.in_progress()) {
    outcome.detail = "rebuild already in progress";
    observability::record_event(
        observability::SyncPollEvent{.trigger = "busy", .rebuild_started = false});
    return outcome;
  }

  const auto trigger = evaluate_triggers(outcome);
  if (!trigger.has_value()) {
    observability::record_event(
        observability::SyncPollEvent{.trigger = "none", .rebuild_started = false});
    return outcome;
  }

  outcome.trigger = *trigger;
  run_rebuild(*trigger, outcome);
  observability::record_event(observability::SyncPollEvent{
      .trigger = std::string(trigger_name(*trigger)), .rebuild_started = outcome.rebuilt});
  return outcome;
}

std::optional<SyncTrigger> Synchronizer::evaluate_triggers(PollOutcome &outcome) {
  std::error_code ec;
  if (!std::filesystem::exists(builder_.index_path(), ec)) {
    outcome.detail = "no index at " + builder_.index_path().string();
    seed_baseline();
    return SyncTrigger::IndexAbsent;
  }

  const auto uptime = source_.source_uptime_seconds();
  if (!uptime.ok()) {
    outcome.detail = uptime.error();
    observability::record_warning("sync", "cannot read source uptime: " + uptime.error());
    return std::nullopt;
  }
  if (uptime.value() < options_.source_uptime_threshold.count()) {
    outcome.detail = "source uptime " + std::to_string(uptime.value()) + "s";
    seed_baseline();
    return SyncTrigger::SourceRestarted;
  }

  const auto latest = source_.max_modification_timestamp_of_active_entries();
  if (!latest.ok()) {
    outcome.detail = latest.error();
    observability::record_warning("sync",
                                  "cannot read source modification time: " + latest.error());
    return std::nullopt;
  }
  if (!latest.value().has_value()) {
    return std::nullopt;
  }

  const auto observed = *latest.value();
  if (!last_seen_modification_.has_value()) {
    set_observed(observed);
    outcome.detail = "baseline " + common::format_rfc3339(observed);
    return std::nullopt;
  }
  if (observed > *last_seen_modification_) {
    outcome.detail = "modified at " + common::format_rfc3339(observed) + " (previous " +
                     common::format_rfc3339(*last_seen_modification_) + ")";
    // The baseline moves even if the guard drops this rebuild.
    set_observed(observed);
    return SyncTrigger::SourceModified;
  }
  return std::nullopt;
}

void Synchronizer::seed_baseline() {
  if (last_seen_modification_.has_value()) {
    return;
  }
  const auto latest = source_.max_modification_timestamp_of_active_entries();
  if (!latest.ok()) {
    observability::record_warning("sync",
                                  "cannot read source modification time: " + latest.error());
    return;
  }
  if (latest.value().has_value()) {
    set_observed(*latest.value());
  }
}

void Synchronizer::run_rebuild(const SyncTrigger trigger, PollOutcome &outcome) {
  const std::string name(trigger_name(trigger));
  const auto now = clock_->now();

  if (last_rebuild_attempt_.has_value() &&
      now - *last_rebuild_attempt_ < options_.min_rebuild_interval) {
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(now - *last_rebuild_attempt_);
    const std::string reason = "last rebuild " + std::to_string(elapsed.count()) +
                               "s ago, minimum " +
                               std::to_string(options_.min_rebuild_interval.count()) + "s";
    outcome.skipped = true;
    observability::record_event(
        observability::RebuildSkippedEvent{.trigger = name, .reason = reason});
    return;
  }
  if (builder_.in_progress()) {
    outcome.skipped = true;
    observability::record_event(observability::RebuildSkippedEvent{
        .trigger = name, .reason = "rebuild already in progress"});
    return;
  }

  const auto result = builder_.rebuild(name + (outcome.detail.empty() ? "" : ": " + outcome.detail));
  const auto finished = clock_->now();
  last_rebuild_attempt_ = finished;
  set_last_rebuild(finished);
  outcome.rebuilt = result.ok();
  if (!result.ok()) {
    outcome.detail = result.error();
  }
}

common::Result<RebuildStats> Synchronizer::force_rebuild() {
  auto result = builder_.rebuild("forced");
  set_last_rebuild(clock_->now());
  return result;
}

void Synchronizer::set_observed(std::optional<common::TimePoint> value) {
  last_seen_modification_ = value;
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  observed_snapshot_ = value;
}

void Synchronizer::set_last_rebuild(const common::TimePoint value) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  last_rebuild_snapshot_ = value;
}

SyncStatus Synchronizer::status() const {
  SyncStatus status;
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    status.last_observed_modification = observed_snapshot_;
    status.last_rebuild_time = last_rebuild_snapshot_;
  }
  status.active = running_.load();
  status.rebuild_in_progress = builder_.in_progress();
  status.index_size = handle_.size();
  status.poll_interval = options_.poll_interval;
  status.source_uptime_threshold = options_.source_uptime_threshold;
  status.min_rebuild_interval = options_.min_rebuild_interval;
  std::error_code ec;
  status.index_file_exists = std::filesystem::exists(builder_.index_path(), ec);
  return status;
}

} // namespace ragsync::sync
