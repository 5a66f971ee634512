#pragma once

#include "mcpguard/common/result.hpp"
#include "mcpguard/security/policy.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpguard::security {

/// Runtime buses a server's services are routed through.
enum class BusKind { Tool, Memory, Guidance };

[[nodiscard]] std::string bus_kind_to_string(BusKind kind);
[[nodiscard]] common::Result<BusKind> bus_kind_from_string(const std::string &value);
[[nodiscard]] common::Result<std::set<BusKind>>
bus_bindings_from_strings(const std::vector<std::string> &values);
[[nodiscard]] std::string format_bus_bindings(const std::set<BusKind> &bindings);

struct ServerRegistration {
  std::string server_id;
  std::set<BusKind> bus_bindings = {BusKind::Tool};
  // Unset means the manager's default policy applies.
  std::optional<SecurityPolicy> policy;
};

} // namespace mcpguard::security
