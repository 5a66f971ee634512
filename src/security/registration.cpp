#include "mcpguard/security/registration.hpp"

#include "mcpguard/common/strings.hpp"

namespace mcpguard::security {

std::string bus_kind_to_string(const BusKind kind) {
  switch (kind) {
  case BusKind::Tool:
    return "tool";
  case BusKind::Memory:
    return "memory";
  case BusKind::Guidance:
    return "guidance";
  }
  return "unknown";
}

common::Result<BusKind> bus_kind_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "tool") {
    return common::Result<BusKind>::success(BusKind::Tool);
  }
  if (normalized == "memory") {
    return common::Result<BusKind>::success(BusKind::Memory);
  }
  if (normalized == "guidance") {
    return common::Result<BusKind>::success(BusKind::Guidance);
  }
  return common::Result<BusKind>::failure("Unknown bus: " + value);
}

common::Result<std::set<BusKind>> bus_bindings_from_strings(const std::vector<std::string> &values) {
  std::set<BusKind> bindings;
  for (const auto &value : values) {
    const auto kind = bus_kind_from_string(value);
    if (!kind.ok()) {
      return common::Result<std::set<BusKind>>::failure(kind.error());
    }
    bindings.insert(kind.value());
  }
  return common::Result<std::set<BusKind>>::success(std::move(bindings));
}

std::string format_bus_bindings(const std::set<BusKind> &bindings) {
  std::vector<std::string> names;
  names.reserve(bindings.size());
  for (const auto kind : bindings) {
    names.push_back(bus_kind_to_string(kind));
  }
  return names.empty() ? "none" : common::join(names, ",");
}

} // namespace mcpguard::security
