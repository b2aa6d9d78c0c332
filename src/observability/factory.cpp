#include "wiredrive/observability/factory.hpp"

#include "wiredrive/common/fs.hpp"
#include "wiredrive/observability/log_observer.hpp"
#include "wiredrive/observability/multi_observer.hpp"
#include "wiredrive/observability/noop_observer.hpp"

#include <set>
#include <sstream>

namespace wiredrive::observability {

std::shared_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_shared<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_shared<LogObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_shared<MultiObserver>();
    std::stringstream stream(backend);
    std::set<std::string> seen;
    std::string part;
    while (std::getline(stream, part, ',')) {
      std::string p = common::to_lower(common::trim(part));
      if (p == "none") {
        p = "noop";
      }
      if (!seen.insert(p).second) {
        continue;
      }
      if (p == "log") {
        multi->add(std::make_shared<LogObserver>());
      } else if (p == "noop") {
        multi->add(noop_observer());
      }
    }
    return multi;
  }

  return std::make_shared<LogObserver>();
}

std::shared_ptr<IObserver> noop_observer() {
  static const std::shared_ptr<IObserver> instance = std::make_shared<NoopObserver>();
  return instance;
}

} // namespace wiredrive::observability
