#pragma once

#include "mcpguard/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpguard::common {

/// Flat view of a TOML document: `[a.b]` followed by `k = v` is stored under "a.b.k".
/// Arrays must fit on one line.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] bool is_bool(const std::string &key) const;
  [[nodiscard]] std::int64_t get_i64(const std::string &key, std::int64_t fallback) const;
  [[nodiscard]] bool is_integer(const std::string &key) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  /// Names of the direct child tables of `prefix`, e.g. "servers" -> {"alpha", "beta"}.
  [[nodiscard]] std::vector<std::string> child_tables(const std::string &prefix) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace mcpguard::common
