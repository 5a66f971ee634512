#pragma once

#include "mcpguard/observability/observer.hpp"

#include <memory>

namespace mcpguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_server_registered(const std::string &server_id, const std::string &bus_bindings,
                              bool updated);
void record_server_unregistered(const std::string &server_id);
void record_violation(const std::string &violation_type, const std::string &server_id,
                      const std::optional<std::string> &tool_name, const std::string &message,
                      const std::optional<std::string> &detail,
                      const std::optional<std::string> &audit_record = std::nullopt);
void record_scan_bypassed(const std::string &subject);
void record_ledger_size(std::uint64_t size, std::uint64_t evicted);
void record_in_flight(const std::string &server_id, std::uint64_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace mcpguard::observability
