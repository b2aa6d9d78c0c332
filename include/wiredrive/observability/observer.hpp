#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace wiredrive::observability {

struct DriverStartEvent {
  std::string kind;
  std::string binary;
  std::uint16_t port = 0;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct DriverStopEvent {
  std::string kind;
  std::uint16_t port = 0;
  std::chrono::milliseconds duration{0};
  bool forced = false;
};

struct CommandEvent {
  std::string method;
  std::string path;
  long http_status = 0;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct RedirectEvent {
  std::string from;
  std::string location;
  int hop = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<DriverStartEvent, DriverStopEvent, CommandEvent, RedirectEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ActiveDriversMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, ActiveDriversMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace wiredrive::observability
