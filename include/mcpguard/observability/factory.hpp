#pragma once

#include "mcpguard/config/schema.hpp"
#include "mcpguard/observability/observer.hpp"

#include <memory>

namespace mcpguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace mcpguard::observability
