#pragma once

#include "mcpguard/observability/observer.hpp"

namespace mcpguard::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace mcpguard::observability
