#pragma once

#include "sandcastle/observability/observer.hpp"

namespace sandcastle::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace sandcastle::observability
