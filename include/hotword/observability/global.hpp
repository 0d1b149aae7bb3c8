#pragma once

#include "hotword/observability/observer.hpp"

#include <memory>

namespace hotword::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_transition(const std::string &from, const std::string &to, const std::string &reason);
void record_start_blocked(const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace hotword::observability
