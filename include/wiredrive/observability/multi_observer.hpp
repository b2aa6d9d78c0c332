#pragma once

#include "wiredrive/observability/observer.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace wiredrive::observability {

/// Fans every event and metric out to its registered observers, in
/// registration order. Safe to share between a supervisor and its sessions.
class MultiObserver final : public IObserver {
public:
  /// False when `observer` is null or already registered.
  bool add(std::shared_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  [[nodiscard]] std::vector<std::shared_ptr<IObserver>> snapshot() const;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<IObserver>> observers_;
};

} // namespace wiredrive::observability
