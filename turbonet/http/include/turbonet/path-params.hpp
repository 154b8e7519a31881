#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "turbonet/vector.hpp"

namespace turbonet {

// Typed value of a path capture: int for <int:x>, double for <float:x>, string for <x>, <string:x> and <path:x>.
using CaptureValue = std::variant<int64_t, double, std::string>;

struct PathParam {
  std::string name;
  CaptureValue value;
};

// Captures of the matched route, in pattern order.
class PathParams {
 public:
  PathParams() noexcept = default;

  void add(std::string name, CaptureValue value) { _params.push_back(PathParam{std::move(name), std::move(value)}); }

  [[nodiscard]] const CaptureValue* find(std::string_view name) const noexcept {
    for (const PathParam& param : _params) {
      if (param.name == name) {
        return &param.value;
      }
    }
    return nullptr;
  }

  // Typed access: returns std::nullopt if the capture does not exist or holds another type.
  template <class T>
  [[nodiscard]] std::optional<T> get(std::string_view name) const {
    const CaptureValue* value = find(name);
    if (value == nullptr) {
      return std::nullopt;
    }
    if (const T* typed = std::get_if<T>(value)) {
      return *typed;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto begin() const noexcept { return _params.begin(); }
  [[nodiscard]] auto end() const noexcept { return _params.end(); }

  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }
  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  void clear() noexcept { _params.clear(); }

 private:
  SmallVector<PathParam, 4> _params;
};

}  // namespace turbonet
