#include "mcpguard/security/policy.hpp"

#include "mcpguard/common/strings.hpp"
#include "mcpguard/security/content_scanner.hpp"

#include <algorithm>

namespace mcpguard::security {

namespace {

bool contains_normalized(const std::set<std::string> &names, const std::string &normalized) {
  return std::any_of(names.begin(), names.end(), [&normalized](const std::string &entry) {
    return SecurityPolicy::normalize_tool_name(entry) == normalized;
  });
}

std::set<std::string> normalized_set(const std::vector<std::string> &names) {
  std::set<std::string> out;
  for (const auto &name : names) {
    const std::string normalized = SecurityPolicy::normalize_tool_name(name);
    if (!normalized.empty()) {
      out.insert(normalized);
    }
  }
  return out;
}

} // namespace

std::string SecurityPolicy::normalize_tool_name(const std::string_view name) {
  return common::to_lower(common::trim(std::string(name)));
}

common::Result<SecurityPolicy> SecurityPolicy::from_config(const config::PolicyConfig &config) {
  SecurityPolicy policy;
  policy.blocked_tools = normalized_set(config.blocked_tools);
  policy.allowed_tools = normalized_set(config.allowed_tools);
  policy.max_calls_per_minute = config.max_calls_per_minute;
  policy.max_concurrent_calls = config.max_concurrent_calls;
  policy.max_input_size_bytes = config.max_input_size_bytes;
  policy.max_output_size_bytes = config.max_output_size_bytes;
  policy.detect_tool_poisoning = config.detect_tool_poisoning;
  policy.custom_detection_patterns = config.custom_detection_patterns;

  if (const auto status = policy.validate(); !status.ok()) {
    return common::Result<SecurityPolicy>::failure(status.error());
  }
  return common::Result<SecurityPolicy>::success(std::move(policy));
}

common::Status SecurityPolicy::validate() const {
  if (max_calls_per_minute <= 0) {
    return common::Status::error("max_calls_per_minute must be > 0, got " +
                                 std::to_string(max_calls_per_minute));
  }
  if (max_concurrent_calls <= 0) {
    return common::Status::error("max_concurrent_calls must be > 0, got " +
                                 std::to_string(max_concurrent_calls));
  }
  if (max_input_size_bytes < 0) {
    return common::Status::error("max_input_size_bytes must be >= 0, got " +
                                 std::to_string(max_input_size_bytes));
  }
  if (max_output_size_bytes < 0) {
    return common::Status::error("max_output_size_bytes must be >= 0, got " +
                                 std::to_string(max_output_size_bytes));
  }
  for (const auto &pattern : custom_detection_patterns) {
    if (const auto status = ContentScanner::validate_pattern(pattern); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

bool SecurityPolicy::is_blocked(const std::string_view tool_name) const {
  return contains_normalized(blocked_tools, normalize_tool_name(tool_name));
}

bool SecurityPolicy::is_allowlisted(const std::string_view tool_name) const {
  if (allowed_tools.empty()) {
    return true;
  }
  return contains_normalized(allowed_tools, normalize_tool_name(tool_name));
}

} // namespace mcpguard::security
