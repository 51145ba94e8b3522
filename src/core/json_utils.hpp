#ifndef JTDV_CORE_JSON_UTILS_HPP_
#define JTDV_CORE_JSON_UTILS_HPP_

#include <string>
#include <string_view>

namespace jtdv::core {

// Appends `input` as a quoted JSON string literal. Control characters without a
// short escape are written as \u00XX; everything else, including non-ASCII
// UTF-8 bytes, is copied through unchanged.
inline void AppendJsonString(std::string& out, std::string_view input) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  out.push_back('"');
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out += "\\u00";
        out.push_back(kHexDigits[(as_unsigned >> 4U) & 0x0FU]);
        out.push_back(kHexDigits[as_unsigned & 0x0FU]);
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  out.push_back('"');
}

inline std::string QuoteJson(std::string_view input) {
  std::string out;
  out.reserve(input.size() + 2U);
  AppendJsonString(out, input);
  return out;
}

} // namespace jtdv::core

#endif // JTDV_CORE_JSON_UTILS_HPP_
