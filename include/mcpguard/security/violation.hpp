#pragma once

#include "mcpguard/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace mcpguard::security {

enum class ViolationType {
  BlockedTool,
  ToolPoisoning,
  RateLimitExceeded,
  InputTooLarge,
  OutputTooLarge,
};

[[nodiscard]] std::string violation_type_to_string(ViolationType type);
[[nodiscard]] common::Result<ViolationType> violation_type_from_string(const std::string &value);

struct SecurityViolation {
  ViolationType type = ViolationType::BlockedTool;
  std::string server_id;
  std::optional<std::string> tool_name;
  std::string message;
  std::chrono::system_clock::time_point detected_at;
  std::optional<std::string> raw_detail;
};

[[nodiscard]] SecurityViolation make_violation(ViolationType type, std::string server_id,
                                               std::optional<std::string> tool_name,
                                               std::string message,
                                               std::optional<std::string> raw_detail = std::nullopt);

/// RFC 3339 UTC timestamp with millisecond precision.
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point time);

/// Single-line JSON object for audit export. Absent optional fields are omitted.
[[nodiscard]] std::string violation_to_json(const SecurityViolation &violation);

} // namespace mcpguard::security
