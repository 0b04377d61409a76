#pragma once

#include "sessionrelay/observability/observer.hpp"

#include <memory>
#include <vector>

namespace sessionrelay::observability {

/// Fans every event out to its children, e.g. stderr and the relay log file together.
/// Children are added during setup only; recording is safe from any thread once the
/// children themselves are.
class MultiObserver final : public IObserver {
public:
  /// Null observers are ignored.
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void each(Fn &&fn) {
    for (auto &observer : observers_) {
      fn(*observer);
    }
  }

  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace sessionrelay::observability
