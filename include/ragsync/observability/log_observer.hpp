#pragma once

#include "ragsync/observability/observer.hpp"

#include <mutex>
#include <optional>

namespace ragsync::observability {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

[[nodiscard]] std::string_view log_level_name(LogLevel level);
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

/// Writes one `[LEVEL] message` line to stderr for every event at or above `min_level`.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void write(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::mutex mutex_;
};

} // namespace ragsync::observability
