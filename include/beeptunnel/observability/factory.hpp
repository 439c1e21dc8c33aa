#pragma once

#include "beeptunnel/config/schema.hpp"
#include "beeptunnel/observability/observer.hpp"

#include <memory>

namespace beeptunnel::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace beeptunnel::observability
