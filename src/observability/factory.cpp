#include "beeptunnel/observability/factory.hpp"

#include "beeptunnel/common/fs.hpp"
#include "beeptunnel/observability/log_observer.hpp"
#include "beeptunnel/observability/noop_observer.hpp"

namespace beeptunnel::observability {

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>(config.verbose);
}

} // namespace beeptunnel::observability
