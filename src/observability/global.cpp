#include "paramvault/observability/global.hpp"

#include <mutex>

namespace paramvault::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_store_opened(const std::string &driver, const std::string &path) {
  record_event(StoreOpenedEvent{.driver = driver, .path = path});
}

void record_store_initialized() { record_event(StoreInitializedEvent{}); }

void record_unlock_attempt(const std::string &method, const bool success,
                           const std::chrono::milliseconds duration) {
  record_event(UnlockAttemptEvent{.method = method, .success = success, .duration = duration});
}

void record_method_registered(const std::string &method) {
  record_event(MethodRegisteredEvent{.method = method});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_kdf_duration(const std::chrono::milliseconds duration) {
  record_metric(KdfDurationMetric{.duration = duration});
}

void record_scan_rows(const std::uint64_t rows) { record_metric(ScanRowsMetric{.rows = rows}); }

} // namespace paramvault::observability
