#include "paramvault/observability/log_observer.hpp"

#include "paramvault/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace paramvault::observability {

namespace {

const char *level_label(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string &text) {
  const std::string level = common::to_lower(common::trim(text));
  if (level == "debug") {
    return LogLevel::Debug;
  }
  if (level == "info") {
    return LogLevel::Info;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const LogLevel min_level, std::ostream *out)
    : min_level_(min_level), out_(out == nullptr ? &std::cerr : out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  *out_ << "[" << level_label(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, StoreOpenedEvent>) {
          log_line(LogLevel::Debug, "store.open driver=" + evt.driver + " path=" + evt.path);
        } else if constexpr (std::is_same_v<T, StoreInitializedEvent>) {
          log_line(LogLevel::Info, "store.initialized");
        } else if constexpr (std::is_same_v<T, UnlockAttemptEvent>) {
          log_line(evt.success ? LogLevel::Info : LogLevel::Warn,
                   "unlock method=" + evt.method +
                       " success=" + (evt.success ? std::string("true") : std::string("false")) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, MethodRegisteredEvent>) {
          log_line(LogLevel::Info, "method.registered method=" + evt.method);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, KdfDurationMetric>) {
          log_line(LogLevel::Debug, "metric.kdf_duration_ms=" + std::to_string(m.duration.count()));
        } else if constexpr (std::is_same_v<T, ScanRowsMetric>) {
          log_line(LogLevel::Debug, "metric.scan_rows=" + std::to_string(m.rows));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace paramvault::observability
