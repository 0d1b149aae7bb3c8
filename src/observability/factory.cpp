#include "hotword/observability/factory.hpp"

#include "hotword/common/fs.hpp"
#include "hotword/observability/log_observer.hpp"

namespace hotword::observability {

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return nullptr;
  }
  return std::make_unique<LogObserver>(config.debug);
}

} // namespace hotword::observability
