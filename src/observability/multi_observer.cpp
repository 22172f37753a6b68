#include "paramvault/observability/multi_observer.hpp"

#include <algorithm>

namespace paramvault::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> observers)
    : observers_(std::move(observers)) {
  observers_.erase(std::remove(observers_.begin(), observers_.end(), nullptr), observers_.end());
}

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  std::for_each(observers_.begin(), observers_.end(),
                [&event](const auto &observer) { observer->record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  std::for_each(observers_.begin(), observers_.end(),
                [&metric](const auto &observer) { observer->record_metric(metric); });
}

void MultiObserver::flush() {
  std::for_each(observers_.begin(), observers_.end(),
                [](const auto &observer) { observer->flush(); });
}

} // namespace paramvault::observability
