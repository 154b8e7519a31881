#include "turbonet/json-escape.hpp"

#include <string>
#include <string_view>

namespace turbonet {

void AppendJsonString(std::string& out, std::string_view str) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  out.reserve(out.size() + str.size() + 2U);
  out.push_back('"');
  for (char ch : str) {
    switch (ch) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20U) {
          out.append("\\u00");
          out.push_back(kHexDigits[(static_cast<unsigned char>(ch) >> 4U) & 0xFU]);
          out.push_back(kHexDigits[static_cast<unsigned char>(ch) & 0xFU]);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
  out.push_back('"');
}

}  // namespace turbonet
