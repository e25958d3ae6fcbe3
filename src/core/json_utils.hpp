#ifndef PERMITPACK_CORE_JSON_UTILS_HPP_
#define PERMITPACK_CORE_JSON_UTILS_HPP_

#include <string>
#include <string_view>

namespace permitpack::core {

// JSON string escaping for the preference store and `--json` CLI output.
inline std::string EscapeJson(std::string_view input) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  std::string escaped;
  escaped.reserve(input.size());
  for (const char ch : input) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
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
    default: {
      const auto byte = static_cast<unsigned char>(ch);
      if (byte < 0x20U) {
        escaped += "\\u00";
        escaped.push_back(kHexDigits[byte >> 4U]);
        escaped.push_back(kHexDigits[byte & 0x0FU]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
    }
  }
  return escaped;
}

inline std::string QuoteJson(std::string_view input) {
  std::string quoted = "\"";
  quoted += EscapeJson(input);
  quoted.push_back('"');
  return quoted;
}

} // namespace permitpack::core

#endif // PERMITPACK_CORE_JSON_UTILS_HPP_
