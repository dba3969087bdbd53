#include "sandcastle/observability/global.hpp"

#include <mutex>

namespace sandcastle::observability {

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

void record_provider_ready(const std::string &runtime, const std::string &detail,
                           const bool warning) {
  record_event(ProviderReadyEvent{.runtime = runtime, .detail = detail, .warning = warning});
}

void record_sandbox_lifecycle(const std::string &runtime, const std::string &sandbox_id,
                              const std::string &action, const std::string &state) {
  record_event(SandboxLifecycleEvent{
      .runtime = runtime, .sandbox_id = sandbox_id, .action = action, .state = state});
}

void record_command_exec(const std::string &runtime, const std::string &sandbox_id,
                         const std::string &session, const bool async_exec,
                         const std::chrono::milliseconds duration,
                         const std::optional<int> exit_code) {
  record_event(CommandExecEvent{.runtime = runtime,
                                .sandbox_id = sandbox_id,
                                .session = session,
                                .async_exec = async_exec,
                                .duration = duration,
                                .exit_code = exit_code});
}

void record_runtime_switch(const std::string &previous, const std::string &requested,
                           const bool success, const std::string &reason) {
  record_event(RuntimeSwitchEvent{
      .previous = previous, .requested = requested, .success = success, .reason = reason});
}

void record_backend_latency(const std::string &runtime, const std::string &operation,
                            const std::chrono::milliseconds latency) {
  record_metric(
      BackendLatencyMetric{.runtime = runtime, .operation = operation, .latency = latency});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace sandcastle::observability
