#include "mcpguard/observability/global.hpp"

#include <mutex>

namespace mcpguard::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_server_registered(const std::string &server_id, const std::string &bus_bindings,
                              const bool updated) {
  record_event(ServerRegisteredEvent{
      .server_id = server_id, .bus_bindings = bus_bindings, .updated = updated});
}

void record_server_unregistered(const std::string &server_id) {
  record_event(ServerUnregisteredEvent{.server_id = server_id});
}

void record_violation(const std::string &violation_type, const std::string &server_id,
                      const std::optional<std::string> &tool_name, const std::string &message,
                      const std::optional<std::string> &detail,
                      const std::optional<std::string> &audit_record) {
  record_event(ViolationEvent{.violation_type = violation_type,
                              .server_id = server_id,
                              .tool_name = tool_name,
                              .message = message,
                              .detail = detail,
                              .audit_record = audit_record});
}

void record_scan_bypassed(const std::string &subject) {
  record_event(ScanBypassedEvent{.subject = subject});
}

void record_ledger_size(const std::uint64_t size, const std::uint64_t evicted) {
  record_metric(LedgerSizeMetric{.size = size, .evicted = evicted});
}

void record_in_flight(const std::string &server_id, const std::uint64_t count) {
  record_metric(InFlightCallsMetric{.server_id = server_id, .count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace mcpguard::observability
