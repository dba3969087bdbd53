#include "test_framework.hpp"

#include "sandcastle/common/json_util.hpp"
#include "sandcastle/health/health.hpp"
#include "sandcastle/observability/factory.hpp"
#include "sandcastle/observability/global.hpp"
#include "sandcastle/observability/multi_observer.hpp"
#include "sandcastle/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

void register_observability_health_tests(std::vector<sandcastle::tests::TestCase> &tests) {
  using sandcastle::tests::require;
  namespace obs = sandcastle::observability;
  namespace health = sandcastle::health;

  tests.push_back({"observer_factory_selects_backend", [] {
                     auto config = sandcastle::testing::daytona_test_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");
                     config.observability.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log", "case-insensitive");
                     config.observability.backend = "log,noop";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list -> multi");
                     require(dynamic_cast<obs::MultiObserver *>(multi.get())->size() == 2,
                             "two children");
                     config.observability.backend = "prometheus";
                     require(obs::create_observer(config)->name() == "log", "unknown -> log");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_unique<sandcastle::testing::RecordingObserver>();
                     auto second = std::make_unique<sandcastle::testing::RecordingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     obs::MultiObserver multi;
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(std::make_unique<obs::NoopObserver>());

                     multi.record_event(obs::ErrorEvent{.component = "x", .message = "boom"});
                     multi.record_metric(obs::CachedProvidersMetric{.count = 2});
                     require(first_ptr->events().size() == 1 && second_ptr->events().size() == 1,
                             "event delivered to all");
                     require(first_ptr->metrics().size() == 1, "metric delivered");
                   }});

  tests.push_back({"global_helpers_record_typed_events", [] {
                     sandcastle::testing::ScopedRecordingObserver scoped;
                     obs::record_runtime_switch("daytona", "e2b", true);
                     obs::record_provider_ready("e2b", "local", true);
                     obs::record_backend_latency("daytona", "get", std::chrono::milliseconds(5));

                     const auto events = scoped.observer().events();
                     require(events.size() == 2, "two events");
                     const auto *sw = std::get_if<obs::RuntimeSwitchEvent>(&events[0]);
                     require(sw != nullptr && sw->previous == "daytona" && sw->requested == "e2b" &&
                                 sw->success,
                             "switch event fields");
                     const auto *ready = std::get_if<obs::ProviderReadyEvent>(&events[1]);
                     require(ready != nullptr && ready->warning, "warning flag kept");

                     const auto metrics = scoped.observer().metrics();
                     const auto *latency = std::get_if<obs::BackendLatencyMetric>(&metrics.at(0));
                     require(latency != nullptr && latency->latency.count() == 5, "latency metric");
                   }});

  tests.push_back({"recording_without_observer_is_harmless", [] {
                     obs::set_global_observer(nullptr);
                     obs::record_error("test", "nobody listening");
                     require(obs::get_global_observer() == nullptr, "still no observer");
                   }});

  tests.push_back({"health_component_transitions", [] {
                     health::reset_component("test.component");
                     health::mark_component_starting("test.component");
                     auto component = health::get_component("test.component");
                     require(component.has_value() && component->status == "starting", "starting");

                     health::mark_component_error("test.component", "bad \"credentials\"");
                     component = health::get_component("test.component");
                     require(component->status == "error", "error state");
                     require(component->last_error == "bad \"credentials\"", "error kept");

                     health::mark_component_ok("test.component");
                     component = health::get_component("test.component");
                     require(component->status == "ok", "ok state");
                     require(!component->last_error.has_value(), "error cleared");
                     require(component->last_ok.has_value(), "last ok stamped");
                     health::reset_component("test.component");
                     require(!health::get_component("test.component").has_value(), "reset");
                   }});

  tests.push_back({"health_snapshot_json_is_escaped", [] {
                     health::reset_component("test.json");
                     health::mark_component_error("test.json", "line1\n\"quoted\"");
                     const std::string json = health::snapshot_json();
                     require(json.find("\"test.json\":{\"status\":\"error\"") != std::string::npos,
                             "component entry");
                     require(json.find("line1\\n\\\"quoted\\\"") != std::string::npos,
                             "error escaped");
                     health::reset_component("test.json");
                   }});
}
