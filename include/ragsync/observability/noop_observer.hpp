#pragma once

#include "ragsync/observability/observer.hpp"

namespace ragsync::observability {

/// Selected by `observability.backend = "none"`; tests install it between suites.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace ragsync::observability
