#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "paramvault/observability/factory.hpp"
#include "paramvault/observability/global.hpp"
#include "paramvault/observability/log_observer.hpp"
#include "paramvault/observability/multi_observer.hpp"
#include "paramvault/params/parameter_store.hpp"

#include <sstream>

namespace {

class RecordingObserver final : public paramvault::observability::IObserver {
public:
  void record_event(const paramvault::observability::ObserverEvent &event) override {
    events.push_back(event);
  }
  void record_metric(const paramvault::observability::ObserverMetric &metric) override {
    metrics.push_back(metric);
  }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  std::vector<paramvault::observability::ObserverEvent> events;
  std::vector<paramvault::observability::ObserverMetric> metrics;
};

struct GlobalObserverReset {
  ~GlobalObserverReset() { paramvault::observability::set_global_observer(nullptr); }
};

} // namespace

void register_observability_tests(std::vector<paramvault::tests::TestCase> &tests) {
  using paramvault::tests::require;
  using paramvault::tests::require_code;
  namespace obs = paramvault::observability;
  namespace params = paramvault::params;
  namespace pt = paramvault::testing;

  tests.push_back({"log_observer_filters_by_level", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Info, &out);
                     observer.record_event(obs::StoreOpenedEvent{.driver = "local", .path = "/x"});
                     observer.record_event(obs::UnlockAttemptEvent{
                         .method = "password", .success = true, .duration = std::chrono::milliseconds(5)});
                     observer.record_event(obs::UnlockAttemptEvent{
                         .method = "keyring", .success = false, .duration = std::chrono::milliseconds(1)});
                     observer.record_metric(obs::ScanRowsMetric{.rows = 3});
                     const std::string text = out.str();
                     require(text.find("store.open") == std::string::npos, "debug filtered");
                     require(text.find("metric.scan_rows") == std::string::npos, "metric filtered");
                     require(text.find("[INFO] unlock method=password success=true duration_ms=5") !=
                                 std::string::npos,
                             "successful unlock at info: " + text);
                     require(text.find("[WARN] unlock method=keyring success=false") !=
                                 std::string::npos,
                             "failed unlock at warn");
                   }});

  tests.push_back({"log_level_parsing", [] {
                     require(obs::parse_log_level("DEBUG") == obs::LogLevel::Debug, "debug");
                     require(obs::parse_log_level("warning") == obs::LogLevel::Warn, "warning");
                     require(!obs::parse_log_level("loud").has_value(), "unknown");
                   }});

  tests.push_back({"observer_factory_backends", [] {
                     paramvault::config::Config cfg;
                     auto log = obs::create_observer(cfg);
                     require(log.ok(), log.error());
                     require(log.value()->name() == "log", "log by default");

                     cfg.observability.backend = "none";
                     require(obs::create_observer(cfg).value()->name() == "none", "none");

                     cfg.observability.backend = "log, log";
                     auto both = obs::create_observer(cfg);
                     require(both.ok(), both.error());
                     require(both.value()->name() == "multi", "comma list");
                     require(static_cast<obs::MultiObserver *>(both.value().get())->size() == 2,
                             "two children");

                     cfg.observability.backend = "log,none";
                     require(obs::create_observer(cfg).value()->name() == "log",
                             "none entries add nothing");

                     cfg.observability.backend = "statsd";
                     require_code(obs::create_observer(cfg),
                                  paramvault::common::ErrorCode::InvalidArgument,
                                  "unknown backend");
                     cfg.observability.backend = "log";
                     cfg.observability.level = "chatty";
                     require(!obs::create_observer(cfg).ok(), "unknown level");
                   }});

  tests.push_back({"observer_factory_writes_to_given_stream", [] {
                     paramvault::config::Config cfg;
                     cfg.observability.level = "info";
                     std::ostringstream out;
                     auto observer = obs::create_observer(cfg, &out);
                     require(observer.ok(), observer.error());
                     observer.value()->record_event(obs::MethodRegisteredEvent{.method = "keyring"});
                     require(out.str() == "[INFO] method.registered method=keyring\n", out.str());
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     obs::MultiObserver multi;
                     auto first = std::make_unique<RecordingObserver>();
                     auto second = std::make_unique<RecordingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     multi.record_event(obs::StoreInitializedEvent{});
                     multi.record_metric(obs::KdfDurationMetric{});
                     require(multi.size() == 2, "null observer ignored");
                     require(first_ptr->events.size() == 1 && second_ptr->events.size() == 1,
                             "events delivered");
                     require(first_ptr->metrics.size() == 1 && second_ptr->metrics.size() == 1,
                             "metrics delivered");
                   }});

  tests.push_back({"unlock_events_never_carry_secret_names", [] {
                     GlobalObserverReset reset;
                     auto recorder = std::make_unique<RecordingObserver>();
                     auto *recording = recorder.get();
                     obs::set_global_observer(std::move(recorder));

                     pt::VaultFixture vault;
                     pt::initialize_vault(vault, "pw");
                     vault.prompt.push("pw");
                     params::ParameterStore store(
                         vault.store, vault.registry,
                         params::SessionOptions{.read_only = false, .open_method = std::nullopt});
                     require(store.set("super-secret-name", "super-secret-value").ok(), "set");
                     require(store.items().ok(), "scan");

                     bool saw_unlock = false;
                     bool saw_init = false;
                     for (const auto &event : recording->events) {
                       if (const auto *unlock = std::get_if<obs::UnlockAttemptEvent>(&event)) {
                         saw_unlock = true;
                         require(unlock->method == "password" && unlock->success, "unlock event");
                       }
                       if (std::holds_alternative<obs::StoreInitializedEvent>(event)) {
                         saw_init = true;
                       }
                     }
                     require(saw_unlock && saw_init, "events recorded");

                     std::ostringstream rendered;
                     obs::LogObserver log(obs::LogLevel::Debug, &rendered);
                     for (const auto &event : recording->events) {
                       log.record_event(event);
                     }
                     for (const auto &metric : recording->metrics) {
                       log.record_metric(metric);
                     }
                     require(rendered.str().find("super-secret") == std::string::npos,
                             "no secret names or values in telemetry");
                     require(rendered.str().find("metric.scan_rows=1") != std::string::npos,
                             "scan metric: " + rendered.str());
                     require(rendered.str().find("metric.kdf_duration_ms=") != std::string::npos,
                             "kdf metric");
                   }});
}
