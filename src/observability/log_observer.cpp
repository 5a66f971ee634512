#include "mcpguard/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace mcpguard::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ServerRegisteredEvent>) {
          log_line("INFO", std::string(evt.updated ? "server.updated" : "server.registered") +
                               " server=" + evt.server_id + " buses=" + evt.bus_bindings);
        } else if constexpr (std::is_same_v<T, ServerUnregisteredEvent>) {
          log_line("INFO", "server.unregistered server=" + evt.server_id);
        } else if constexpr (std::is_same_v<T, ViolationEvent>) {
          std::string line = "security.violation type=" + evt.violation_type +
                             " server=" + evt.server_id;
          if (evt.tool_name.has_value()) {
            line += " tool=" + *evt.tool_name;
          }
          line += " message=\"" + evt.message + "\"";
          if (evt.detail.has_value()) {
            line += " detail=\"" + *evt.detail + "\"";
          }
          log_line("WARN", line);
          if (evt.audit_record.has_value()) {
            log_line("AUDIT", *evt.audit_record);
          }
        } else if constexpr (std::is_same_v<T, ScanBypassedEvent>) {
          log_line("DEBUG", "scan.bypassed subject=" + evt.subject);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, LedgerSizeMetric>) {
          log_line("DEBUG", "metric.ledger_size=" + std::to_string(m.size) +
                                " evicted=" + std::to_string(m.evicted));
        } else if constexpr (std::is_same_v<T, InFlightCallsMetric>) {
          log_line("DEBUG", "metric.in_flight server=" + m.server_id +
                                " count=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace mcpguard::observability
