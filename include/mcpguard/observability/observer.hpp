#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcpguard::observability {

struct ServerRegisteredEvent {
  std::string server_id;
  std::string bus_bindings;
  bool updated = false;
};

struct ServerUnregisteredEvent {
  std::string server_id;
};

struct ViolationEvent {
  std::string violation_type;
  std::string server_id;
  std::optional<std::string> tool_name;
  std::string message;
  std::optional<std::string> detail;
  // Single-line JSON form of the violation for audit sinks.
  std::optional<std::string> audit_record;
};

struct ScanBypassedEvent {
  std::string subject;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ServerRegisteredEvent, ServerUnregisteredEvent, ViolationEvent,
                                   ScanBypassedEvent, ErrorEvent>;

struct LedgerSizeMetric {
  std::uint64_t size = 0;
  std::uint64_t evicted = 0;
};

struct InFlightCallsMetric {
  std::string server_id;
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<LedgerSizeMetric, InFlightCallsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace mcpguard::observability
