#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace paramvault::observability {

// Events carry method names, paths and counts only. Never put secret names or
// values in them.

struct StoreOpenedEvent {
  std::string driver;
  std::string path;
};

struct StoreInitializedEvent {};

struct UnlockAttemptEvent {
  std::string method;
  bool success = false;
  std::chrono::milliseconds duration{0};
};

struct MethodRegisteredEvent {
  std::string method;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<StoreOpenedEvent, StoreInitializedEvent, UnlockAttemptEvent,
                                   MethodRegisteredEvent, ErrorEvent>;

struct KdfDurationMetric {
  std::chrono::milliseconds duration{0};
};

struct ScanRowsMetric {
  std::uint64_t rows = 0;
};

using ObserverMetric = std::variant<KdfDurationMetric, ScanRowsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace paramvault::observability
