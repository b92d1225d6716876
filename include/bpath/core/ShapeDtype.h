#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include <bpath/core/DType.h>

namespace bpath::core {

// Row-major dimensions; an empty shape is a scalar.
using Shape = std::vector<std::size_t>;

std::size_t num_elements(const Shape& shape) noexcept;

// "(3,)", "(2, 4)", "()"
std::string shape_to_string(const Shape& shape);

// Describes one array without holding any data.
struct ShapeDtype {
  Shape shape;
  DType dtype = default_floating_dtype();

  bool operator==(const ShapeDtype&) const = default;
};

} // namespace bpath::core
