#pragma once

#include "ragsync/observability/observer.hpp"

#include <memory>
#include <vector>

namespace ragsync::observability {

/// Forwards every event and metric to each backend in the order they were added.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> backends);

  /// Null pointers and no-op backends are not kept.
  void add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return backends_.size(); }

  /// Hands back the backends, leaving this observer empty.
  [[nodiscard]] std::vector<std::unique_ptr<IObserver>> release();

private:
  std::vector<std::unique_ptr<IObserver>> backends_;
};

} // namespace ragsync::observability
