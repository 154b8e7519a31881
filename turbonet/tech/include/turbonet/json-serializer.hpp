#pragma once

#ifdef TURBONET_ENABLE_GLAZE

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace turbonet {

/// Serialize a C++ object to a JSON string using glaze.
/// T must be a type that glaze can reflect (aggregate or with a glz::meta specialization).
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace turbonet

#endif  // TURBONET_ENABLE_GLAZE
