#pragma once

#include "mcpguard/common/result.hpp"
#include "mcpguard/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mcpguard::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Load from config_path(). A missing file yields defaults plus env overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_file(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// MCPGUARD_* environment variables win over file values for the default policy and
/// every server table.
[[nodiscard]] common::Status apply_env_overrides(Config &config);

[[nodiscard]] bool is_known_bus(const std::string &name);

} // namespace mcpguard::config
