#pragma once

#include <string>

namespace mcpguard::common {

/// Lower-case hex SHA-256 of `text`.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace mcpguard::common
