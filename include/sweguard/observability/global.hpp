#pragma once

#include "sweguard/observability/observer.hpp"

#include <memory>

namespace sweguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_sandbox(const std::string &sandbox_id, const std::string &kind,
                    const std::string &phase);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace sweguard::observability
