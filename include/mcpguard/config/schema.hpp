#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mcpguard::config {

struct PolicyConfig {
  std::vector<std::string> blocked_tools;
  std::vector<std::string> allowed_tools;
  std::int64_t max_calls_per_minute = 100;
  std::int64_t max_concurrent_calls = 10;
  std::int64_t max_input_size_bytes = 1'048'576;
  std::int64_t max_output_size_bytes = 10'485'760;
  bool detect_tool_poisoning = true;
  std::vector<std::string> custom_detection_patterns;
};

struct ServerConfig {
  std::string id;
  std::vector<std::string> buses = {"tool"};
  PolicyConfig policy;
};

struct LedgerConfig {
  std::int64_t capacity = 1000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  PolicyConfig policy;
  std::vector<ServerConfig> servers;
  LedgerConfig ledger;
  ObservabilityConfig observability;
};

} // namespace mcpguard::config
