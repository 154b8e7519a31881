#pragma once

#include <string>
#include <string_view>

namespace turbonet {

// Appends 'str' as a quoted JSON string literal to 'out', escaping quotes, backslashes and control characters.
void AppendJsonString(std::string& out, std::string_view str);

}  // namespace turbonet
