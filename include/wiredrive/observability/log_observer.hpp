#pragma once

#include "wiredrive/observability/observer.hpp"

#include <mutex>

namespace wiredrive::observability {

/// Writes one `[LEVEL] message` line per event to stderr.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::mutex mutex_;
};

} // namespace wiredrive::observability
