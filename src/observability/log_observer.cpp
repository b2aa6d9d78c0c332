#include "wiredrive/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace wiredrive::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DriverStartEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "driver.start kind=" + evt.kind + " binary=" + evt.binary +
                       " port=" + std::to_string(evt.port) +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, DriverStopEvent>) {
          log_line("INFO", "driver.stop kind=" + evt.kind + " port=" + std::to_string(evt.port) +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " forced=" + bool_text(evt.forced));
        } else if constexpr (std::is_same_v<T, CommandEvent>) {
          log_line("DEBUG", "command " + evt.method + " " + evt.path +
                                " status=" + std::to_string(evt.http_status) +
                                " duration_ms=" + std::to_string(evt.duration.count()) +
                                " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, RedirectEvent>) {
          log_line("DEBUG", "redirect hop=" + std::to_string(evt.hop) + " from=" + evt.from +
                                " location=" + evt.location);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveDriversMetric>) {
          log_line("DEBUG", "metric.active_drivers=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace wiredrive::observability
