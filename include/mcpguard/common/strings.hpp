#pragma once

#include "mcpguard/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mcpguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

/// Shorten `value` to at most `max_chars` bytes, appending "..." when cut.
[[nodiscard]] std::string truncate_for_display(const std::string &value, std::size_t max_chars);

} // namespace mcpguard::common
