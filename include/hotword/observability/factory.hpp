#pragma once

#include "hotword/config/schema.hpp"
#include "hotword/observability/observer.hpp"

#include <memory>

namespace hotword::observability {

// Null for "none"; the global record_* helpers then drop everything.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace hotword::observability
