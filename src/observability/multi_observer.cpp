#include "ragsync/observability/multi_observer.hpp"

namespace ragsync::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> backends) {
  for (auto &backend : backends) {
    add(std::move(backend));
  }
}

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr || observer->name() == "noop") {
    return;
  }
  backends_.push_back(std::move(observer));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &backend : backends_) {
    backend->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &backend : backends_) {
    backend->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &backend : backends_) {
    backend->flush();
  }
}

std::vector<std::unique_ptr<IObserver>> MultiObserver::release() {
  auto out = std::move(backends_);
  backends_.clear();
  return out;
}

} // namespace ragsync::observability
