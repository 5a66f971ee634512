#include "mcpguard/config/config.hpp"

#include "mcpguard/common/strings.hpp"
#include "mcpguard/common/toml.hpp"
#include "mcpguard/security/policy.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace mcpguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".mcpguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

constexpr const char *POLICY_INT_KEYS[] = {"max_calls_per_minute", "max_concurrent_calls",
                                           "max_input_size_bytes", "max_output_size_bytes"};

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("MCPGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::int64_t &policy_int_field(PolicyConfig &policy, const std::string &key) {
  if (key == "max_calls_per_minute") {
    return policy.max_calls_per_minute;
  }
  if (key == "max_concurrent_calls") {
    return policy.max_concurrent_calls;
  }
  if (key == "max_input_size_bytes") {
    return policy.max_input_size_bytes;
  }
  return policy.max_output_size_bytes;
}

common::Result<PolicyConfig> read_policy(const common::TomlDocument &doc,
                                         const std::string &prefix, PolicyConfig policy) {
  const auto key = [&prefix](const char *name) { return prefix + "." + name; };

  policy.blocked_tools = doc.get_string_array(key("blocked_tools"), policy.blocked_tools);
  policy.allowed_tools = doc.get_string_array(key("allowed_tools"), policy.allowed_tools);
  policy.custom_detection_patterns =
      doc.get_string_array(key("custom_detection_patterns"), policy.custom_detection_patterns);

  for (const char *name : POLICY_INT_KEYS) {
    const std::string full = key(name);
    if (!doc.has(full)) {
      continue;
    }
    if (!doc.is_integer(full)) {
      return common::Result<PolicyConfig>::failure(full + " must be an integer");
    }
    std::int64_t &field = policy_int_field(policy, name);
    field = doc.get_i64(full, field);
  }

  const std::string detect_key = key("detect_tool_poisoning");
  if (doc.has(detect_key)) {
    if (!doc.is_bool(detect_key)) {
      return common::Result<PolicyConfig>::failure(detect_key + " must be true or false");
    }
    policy.detect_tool_poisoning = doc.get_bool(detect_key, policy.detect_tool_poisoning);
  }

  return common::Result<PolicyConfig>::success(std::move(policy));
}

std::optional<std::int64_t> env_int(const char *name, std::string &error) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(raw);
  std::int64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    error = std::string(name) + " must be an integer, got '" + value + "'";
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::string> check_policy(const PolicyConfig &policy, const std::string &scope) {
  const auto built = security::SecurityPolicy::from_config(policy);
  if (!built.ok()) {
    return scope + ": " + built.error();
  }
  return std::nullopt;
}

void policy_warnings(const PolicyConfig &policy, const std::string &scope,
                     std::vector<std::string> &warnings) {
  if (!policy.detect_tool_poisoning) {
    warnings.push_back(scope + ": tool poisoning detection is disabled");
  }
  const std::set<std::string> blocked(policy.blocked_tools.begin(), policy.blocked_tools.end());
  for (const auto &tool : policy.allowed_tools) {
    if (blocked.contains(tool)) {
      warnings.push_back(scope + ": '" + tool + "' is both allowed and blocked; blocked wins");
    }
  }
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

bool is_known_bus(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  return normalized == "tool" || normalized == "memory" || normalized == "guidance";
}

common::Status apply_env_overrides(Config &config) {
  std::string error;

  const auto calls = env_int("MCPGUARD_MAX_CALLS_PER_MINUTE", error);
  if (!error.empty()) {
    return common::Status::error(error);
  }
  const auto concurrent = env_int("MCPGUARD_MAX_CONCURRENT_CALLS", error);
  if (!error.empty()) {
    return common::Status::error(error);
  }

  std::optional<bool> detect;
  if (const char *raw = std::getenv("MCPGUARD_DETECT_TOOL_POISONING"); raw != nullptr && *raw) {
    const std::string value = common::to_lower(common::trim(raw));
    if (value == "1" || value == "true" || value == "yes") {
      detect = true;
    } else if (value == "0" || value == "false" || value == "no") {
      detect = false;
    } else {
      return common::Status::error("MCPGUARD_DETECT_TOOL_POISONING must be true or false, got '" +
                                   value + "'");
    }
  }

  const auto apply = [&](PolicyConfig &policy) {
    if (calls.has_value()) {
      policy.max_calls_per_minute = *calls;
    }
    if (concurrent.has_value()) {
      policy.max_concurrent_calls = *concurrent;
    }
    if (detect.has_value()) {
      policy.detect_tool_poisoning = *detect;
    }
  };

  apply(config.policy);
  for (auto &server : config.servers) {
    apply(server.policy);
  }

  if (const char *backend = std::getenv("MCPGUARD_OBSERVABILITY_BACKEND");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }

  return common::Status::success();
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;

  auto policy = read_policy(doc, "policy", config.policy);
  if (!policy.ok()) {
    return common::Result<Config>::failure(policy.error());
  }
  config.policy = policy.value();

  for (const auto &id : doc.child_tables("servers")) {
    const std::string prefix = "servers." + id;
    ServerConfig server;
    server.id = id;
    server.buses = doc.get_string_array(prefix + ".buses", server.buses);

    // Server tables start from the [policy] defaults and override per key.
    auto server_policy = read_policy(doc, prefix, config.policy);
    if (!server_policy.ok()) {
      return common::Result<Config>::failure(server_policy.error());
    }
    server.policy = server_policy.value();
    config.servers.push_back(std::move(server));
  }

  if (doc.has("ledger.capacity")) {
    if (!doc.is_integer("ledger.capacity")) {
      return common::Result<Config>::failure("ledger.capacity must be an integer");
    }
    config.ledger.capacity = doc.get_i64("ledger.capacity", config.ledger.capacity);
  }

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }

  if (const auto env = apply_env_overrides(config.value()); !env.ok()) {
    return common::Result<Config>::failure(env.error());
  }
  return config;
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    if (const auto env = apply_env_overrides(config); !env.ok()) {
      return common::Result<Config>::failure(env.error());
    }
    return common::Result<Config>::success(std::move(config));
  }

  return load_config_file(path);
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (const auto error = check_policy(config.policy, "policy"); error.has_value()) {
    return common::Result<std::vector<std::string>>::failure(*error);
  }
  policy_warnings(config.policy, "policy", warnings);

  std::set<std::string> seen;
  for (const auto &server : config.servers) {
    const std::string scope = "servers." + server.id;
    if (common::trim(server.id).empty()) {
      return common::Result<std::vector<std::string>>::failure("server id must not be empty");
    }
    if (!seen.insert(server.id).second) {
      return common::Result<std::vector<std::string>>::failure("duplicate server id: " +
                                                                server.id);
    }
    if (const auto error = check_policy(server.policy, scope); error.has_value()) {
      return common::Result<std::vector<std::string>>::failure(*error);
    }
    for (const auto &bus : server.buses) {
      if (!is_known_bus(bus)) {
        return common::Result<std::vector<std::string>>::failure(
            scope + ".buses has unknown bus '" + bus + "' (expected tool, memory, guidance)");
      }
    }
    if (server.buses.empty()) {
      warnings.push_back(scope + ": no bus bindings configured");
    }
    if (server.policy.detect_tool_poisoning != config.policy.detect_tool_poisoning ||
        server.policy.allowed_tools != config.policy.allowed_tools ||
        server.policy.blocked_tools != config.policy.blocked_tools) {
      policy_warnings(server.policy, scope, warnings);
    }
  }

  if (config.ledger.capacity <= 0) {
    return common::Result<std::vector<std::string>>::failure("ledger.capacity must be > 0");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  for (const auto &part : common::split(backend, ',')) {
    if (part != "log" && part != "none" && part != "noop") {
      warnings.push_back("observability.backend '" + part + "' is unknown; using log");
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace mcpguard::config
