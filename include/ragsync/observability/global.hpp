#pragma once

#include "ragsync/observability/observer.hpp"

#include <memory>

namespace ragsync::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_info(const std::string &component, const std::string &message);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void record_degraded(const std::string &component, const std::string &reason);

} // namespace ragsync::observability
