#include "sessionrelay/observability/multi_observer.hpp"

namespace sessionrelay::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  each([&event](IObserver &observer) { observer.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  each([&metric](IObserver &observer) { observer.record_metric(metric); });
}

void MultiObserver::flush() {
  each([](IObserver &observer) { observer.flush(); });
}

} // namespace sessionrelay::observability
