#include "mcpguard/common/utf8.hpp"

#include <iomanip>
#include <sstream>

namespace mcpguard::common {

bool next_codepoint(const std::string &input, std::size_t &index, std::uint32_t &cp) {
  if (index >= input.size()) {
    return false;
  }

  const unsigned char lead = static_cast<unsigned char>(input[index]);
  if (lead < 0x80U) {
    cp = lead;
    ++index;
    return true;
  }

  std::size_t extra = 0;
  std::uint32_t value = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
  } else {
    cp = lead;
    ++index;
    return true;
  }

  if (index + extra >= input.size()) {
    cp = lead;
    ++index;
    return true;
  }

  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char cont = static_cast<unsigned char>(input[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      cp = lead;
      ++index;
      return true;
    }
    value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
  }

  index += extra + 1;
  cp = value;
  return true;
}

std::string format_codepoint(const std::uint32_t cp) {
  std::ostringstream out;
  out << "U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << cp;
  return out.str();
}

} // namespace mcpguard::common
