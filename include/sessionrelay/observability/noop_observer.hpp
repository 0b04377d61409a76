#pragma once

#include "sessionrelay/observability/observer.hpp"

namespace sessionrelay::observability {

/// Selected by `backend = "none"`; drops everything.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace sessionrelay::observability
