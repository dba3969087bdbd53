#pragma once

#include "sandcastle/observability/observer.hpp"

#include <memory>

namespace sandcastle::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_provider_ready(const std::string &runtime, const std::string &detail,
                           bool warning = false);
void record_sandbox_lifecycle(const std::string &runtime, const std::string &sandbox_id,
                              const std::string &action, const std::string &state);
void record_command_exec(const std::string &runtime, const std::string &sandbox_id,
                         const std::string &session, bool async_exec,
                         std::chrono::milliseconds duration, std::optional<int> exit_code);
void record_runtime_switch(const std::string &previous, const std::string &requested,
                           bool success, const std::string &reason = "");
void record_backend_latency(const std::string &runtime, const std::string &operation,
                            std::chrono::milliseconds latency);
void record_error(const std::string &component, const std::string &message);

} // namespace sandcastle::observability
