#include "mcpguard/common/json_util.hpp"

#include <iomanip>
#include <sstream>

namespace mcpguard::common {

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        std::ostringstream code;
        code << "\\u" << std::hex << std::setw(4) << std::setfill('0')
             << static_cast<int>(static_cast<unsigned char>(ch));
        escaped += code.str();
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_object(const std::map<std::string, std::string> &fields) {
  std::string out = "{";
  bool first = true;
  for (const auto &[key, value] : fields) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out += json_quote(key);
    out.push_back(':');
    out += json_quote(value);
  }
  out.push_back('}');
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += json_quote(values[i]);
  }
  out.push_back(']');
  return out;
}

} // namespace mcpguard::common
