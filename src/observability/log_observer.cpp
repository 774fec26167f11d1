#include "ragsync/observability/log_observer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>
#include <utility>

namespace ragsync::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

std::string format_score(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return out.str();
}

std::pair<LogLevel, std::string> describe(const ObserverEvent &event) {
  return std::visit(
      [](auto &&evt) -> std::pair<LogLevel, std::string> {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SyncPollEvent>) {
          return {LogLevel::Debug, "sync.poll trigger=" + evt.trigger +
                                       " rebuild=" + bool_text(evt.rebuild_started)};
        } else if constexpr (std::is_same_v<T, RebuildStartEvent>) {
          return {LogLevel::Info, "rebuild.start reason=" + evt.reason};
        } else if constexpr (std::is_same_v<T, RebuildEndEvent>) {
          if (!evt.success) {
            return {LogLevel::Error, "rebuild.failed reason=" + evt.reason + " error=" + evt.error};
          }
          return {LogLevel::Info, "rebuild.end reason=" + evt.reason +
                                      " entries=" + std::to_string(evt.entries) +
                                      " duration_ms=" + std::to_string(evt.duration.count())};
        } else if constexpr (std::is_same_v<T, RebuildSkippedEvent>) {
          return {LogLevel::Info,
                  "rebuild.skipped trigger=" + evt.trigger + " reason=" + evt.reason};
        } else if constexpr (std::is_same_v<T, RetrievalEvent>) {
          return {LogLevel::Info, "retrieval matches=" + std::to_string(evt.matches) +
                                      " confidence=" + format_score(evt.confidence) +
                                      " hedged=" + bool_text(evt.hedged) + " mode=" + evt.mode +
                                      " latency_ms=" + std::to_string(evt.latency.count())};
        } else if constexpr (std::is_same_v<T, DegradedModeEvent>) {
          return {LogLevel::Warn, evt.component + ": degraded mode: " + evt.reason};
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          return {LogLevel::Error, evt.component + ": " + evt.message};
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          return {LogLevel::Warn, evt.component + ": " + evt.message};
        } else {
          return {LogLevel::Info, evt.component + ": " + evt.message};
        }
      },
      event);
}

} // namespace

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::optional<LogLevel> parse_log_level(const std::string_view text) {
  if (text == "debug") {
    return LogLevel::Debug;
  }
  if (text == "info") {
    return LogLevel::Info;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::Warn;
  }
  if (text == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

void LogObserver::write(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  const auto [level, message] = describe(event);
  write(level, message);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  if (min_level_ > LogLevel::Debug) {
    return;
  }
  const std::string message = std::visit(
      [](auto &&m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          return "metric.request_latency_ms=" + std::to_string(m.latency.count());
        } else {
          return "metric.index_size=" + std::to_string(m.vectors);
        }
      },
      metric);
  write(LogLevel::Debug, message);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

} // namespace ragsync::observability
