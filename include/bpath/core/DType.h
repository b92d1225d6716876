#pragma once
#include <string_view>

namespace bpath::core {

enum class DType {
  Bool,
  Int8,
  Int16,
  Int32,
  Int64,
  UInt8,
  UInt16,
  UInt32,
  UInt64,
  Float32,
  Float64,
  Complex64,
  Complex128
};

// True for real and complex floating kinds, i.e. the dtypes a Brownian
// increment can be sampled in.
bool is_floating(DType dtype) noexcept;

bool is_complex(DType dtype) noexcept;

// Short numpy-style name ("float32", "int64", ...).
std::string_view dtype_name(DType dtype) noexcept;

// Parses the names returned by dtype_name plus the short forms
// f32, f64, c64, c128, i32, i64. Throws std::invalid_argument otherwise.
DType parse_dtype(std::string_view name);

constexpr DType default_floating_dtype() noexcept { return DType::Float64; }

} // namespace bpath::core
