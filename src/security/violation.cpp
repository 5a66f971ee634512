#include "mcpguard/security/violation.hpp"

#include "mcpguard/common/json_util.hpp"
#include "mcpguard/common/strings.hpp"

#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace mcpguard::security {

std::string violation_type_to_string(const ViolationType type) {
  switch (type) {
  case ViolationType::BlockedTool:
    return "blocked_tool";
  case ViolationType::ToolPoisoning:
    return "tool_poisoning";
  case ViolationType::RateLimitExceeded:
    return "rate_limit_exceeded";
  case ViolationType::InputTooLarge:
    return "input_too_large";
  case ViolationType::OutputTooLarge:
    return "output_too_large";
  }
  return "unknown";
}

common::Result<ViolationType> violation_type_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  for (const auto type : {ViolationType::BlockedTool, ViolationType::ToolPoisoning,
                          ViolationType::RateLimitExceeded, ViolationType::InputTooLarge,
                          ViolationType::OutputTooLarge}) {
    if (violation_type_to_string(type) == normalized) {
      return common::Result<ViolationType>::success(type);
    }
  }
  return common::Result<ViolationType>::failure("Unknown violation type: " + value);
}

SecurityViolation make_violation(const ViolationType type, std::string server_id,
                                 std::optional<std::string> tool_name, std::string message,
                                 std::optional<std::string> raw_detail) {
  return SecurityViolation{.type = type,
                           .server_id = std::move(server_id),
                           .tool_name = std::move(tool_name),
                           .message = std::move(message),
                           .detected_at = std::chrono::system_clock::now(),
                           .raw_detail = std::move(raw_detail)};
}

std::string format_timestamp(const std::chrono::system_clock::time_point time) {
  const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(time - seconds).count();
  const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);

  std::tm utc{};
  gmtime_r(&raw, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

std::string violation_to_json(const SecurityViolation &violation) {
  std::map<std::string, std::string> fields;
  fields["violation_type"] = violation_type_to_string(violation.type);
  fields["server_id"] = violation.server_id;
  fields["message"] = violation.message;
  fields["detected_at"] = format_timestamp(violation.detected_at);
  if (violation.tool_name.has_value()) {
    fields["tool_name"] = *violation.tool_name;
  }
  if (violation.raw_detail.has_value()) {
    fields["raw_detail"] = *violation.raw_detail;
  }
  return common::json_object(fields);
}

} // namespace mcpguard::security
