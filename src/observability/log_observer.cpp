#include "sandcastle/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace sandcastle::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ProviderReadyEvent>) {
          log_line(evt.warning ? "WARN" : "INFO",
                   "provider.ready runtime=" + evt.runtime + " " + evt.detail);
        } else if constexpr (std::is_same_v<T, SandboxLifecycleEvent>) {
          log_line("INFO", "sandbox." + evt.action + " runtime=" + evt.runtime +
                               " id=" + evt.sandbox_id + " state=" + evt.state);
        } else if constexpr (std::is_same_v<T, CommandExecEvent>) {
          std::string line = "sandbox.exec runtime=" + evt.runtime + " id=" + evt.sandbox_id +
                             " session=" + evt.session + " async=" + bool_text(evt.async_exec) +
                             " duration_ms=" + std::to_string(evt.duration.count());
          if (evt.exit_code.has_value()) {
            line += " exit_code=" + std::to_string(*evt.exit_code);
          }
          log_line("DEBUG", line);
        } else if constexpr (std::is_same_v<T, RuntimeSwitchEvent>) {
          std::string line = "runtime.switch from=" + evt.previous + " to=" + evt.requested +
                             " success=" + bool_text(evt.success);
          if (!evt.reason.empty()) {
            line += " reason=" + evt.reason;
          }
          log_line(evt.success ? "INFO" : "WARN", line);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BackendLatencyMetric>) {
          log_line("DEBUG", "metric.backend_latency_ms runtime=" + m.runtime + " op=" +
                                m.operation + " value=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CachedProvidersMetric>) {
          log_line("DEBUG", "metric.cached_providers=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace sandcastle::observability
