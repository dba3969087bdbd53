#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sandcastle::observability {

/// A provider finished construction. `warning` marks degraded providers
/// such as the local stub.
struct ProviderReadyEvent {
  std::string runtime;
  std::string detail;
  bool warning = false;
};

struct SandboxLifecycleEvent {
  std::string runtime;
  std::string sandbox_id;
  std::string action;
  std::string state;
};

struct CommandExecEvent {
  std::string runtime;
  std::string sandbox_id;
  std::string session;
  bool async_exec = false;
  std::chrono::milliseconds duration{0};
  std::optional<int> exit_code;
};

struct RuntimeSwitchEvent {
  std::string previous;
  std::string requested;
  bool success = false;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ProviderReadyEvent, SandboxLifecycleEvent, CommandExecEvent,
                                   RuntimeSwitchEvent, ErrorEvent>;

struct BackendLatencyMetric {
  std::string runtime;
  std::string operation;
  std::chrono::milliseconds latency{0};
};

struct CachedProvidersMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<BackendLatencyMetric, CachedProvidersMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sandcastle::observability
