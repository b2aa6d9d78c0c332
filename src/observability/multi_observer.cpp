#include "wiredrive/observability/multi_observer.hpp"

#include <algorithm>

namespace wiredrive::observability {

bool MultiObserver::add(std::shared_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(observers_.begin(), observers_.end(), observer) != observers_.end()) {
    return false;
  }
  observers_.push_back(std::move(observer));
  return true;
}

std::size_t MultiObserver::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return observers_.size();
}

std::vector<std::shared_ptr<IObserver>> MultiObserver::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return observers_;
}

// Observers are called outside the lock so one may register another while recording.
void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &observer : snapshot()) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &observer : snapshot()) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &observer : snapshot()) {
    observer->flush();
  }
}

} // namespace wiredrive::observability
