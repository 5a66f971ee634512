#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mcpguard::common {

/// Decode the code point starting at `index` and advance past it. Returns false at end of
/// input. Malformed sequences decode as their lead byte so scanning always makes progress.
[[nodiscard]] bool next_codepoint(const std::string &input, std::size_t &index, std::uint32_t &cp);

/// "U+200B" style rendering.
[[nodiscard]] std::string format_codepoint(std::uint32_t cp);

} // namespace mcpguard::common
