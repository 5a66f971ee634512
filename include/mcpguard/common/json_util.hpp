#pragma once

#include <map>
#include <string>
#include <vector>

namespace mcpguard::common {

/// Escape a string for embedding inside a JSON string literal. Control characters are
/// written as \u00XX so the output is always valid JSON.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Compact JSON object with keys in sorted order. Identical maps produce identical output.
[[nodiscard]] std::string json_object(const std::map<std::string, std::string> &fields);

/// Compact JSON array of strings, in input order.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace mcpguard::common
