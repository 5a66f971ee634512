#pragma once

#include "mcpguard/common/result.hpp"
#include "mcpguard/config/schema.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcpguard::security {

/// Per-deployment (optionally per-server) rules. Blocked tools always win over the allowlist;
/// an empty allowlist allows every tool that is not blocked.
class SecurityPolicy {
public:
  std::set<std::string> blocked_tools;
  std::set<std::string> allowed_tools;
  std::int64_t max_calls_per_minute = 100;
  std::int64_t max_concurrent_calls = 10;
  std::int64_t max_input_size_bytes = 1'048'576;
  std::int64_t max_output_size_bytes = 10'485'760;
  bool detect_tool_poisoning = true;
  std::vector<std::string> custom_detection_patterns;

  [[nodiscard]] static common::Result<SecurityPolicy>
  from_config(const config::PolicyConfig &config);

  /// Rejects negative sizes, non-positive rate limits and custom patterns that do not compile.
  [[nodiscard]] common::Status validate() const;

  [[nodiscard]] bool is_blocked(std::string_view tool_name) const;
  [[nodiscard]] bool is_allowlisted(std::string_view tool_name) const;

  [[nodiscard]] static std::string normalize_tool_name(std::string_view name);

  bool operator==(const SecurityPolicy &other) const = default;
};

} // namespace mcpguard::security
