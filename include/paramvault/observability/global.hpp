#pragma once

#include "paramvault/observability/observer.hpp"

#include <memory>

namespace paramvault::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_store_opened(const std::string &driver, const std::string &path);
void record_store_initialized();
void record_unlock_attempt(const std::string &method, bool success,
                           std::chrono::milliseconds duration);
void record_method_registered(const std::string &method);
void record_error(const std::string &component, const std::string &message);
void record_kdf_duration(std::chrono::milliseconds duration);
void record_scan_rows(std::uint64_t rows);

} // namespace paramvault::observability
