#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ragsync::observability {

struct SyncPollEvent {
  std::string trigger;
  bool rebuild_started = false;
};

struct RebuildStartEvent {
  std::string reason;
};

struct RebuildEndEvent {
  std::string reason;
  bool success = false;
  std::size_t entries = 0;
  std::chrono::milliseconds duration{0};
  std::string error;
};

/// A trigger fired but the anti-thrash guard dropped it.
struct RebuildSkippedEvent {
  std::string trigger;
  std::string reason;
};

struct RetrievalEvent {
  std::size_t matches = 0;
  double confidence = 0.0;
  bool hedged = false;
  std::string mode;
  std::chrono::milliseconds latency{0};
};

struct DegradedModeEvent {
  std::string component;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

struct InfoEvent {
  std::string component;
  std::string message;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SyncPollEvent, RebuildStartEvent, RebuildEndEvent, RebuildSkippedEvent,
                 RetrievalEvent, DegradedModeEvent, ErrorEvent, InfoEvent, WarningEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct IndexSizeMetric {
  std::uint64_t vectors = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, IndexSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace ragsync::observability
