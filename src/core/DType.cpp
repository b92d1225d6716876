#include <bpath/core/DType.h>

#include <stdexcept>
#include <string>

namespace bpath::core {

bool is_floating(DType dtype) noexcept {
  switch (dtype) {
    case DType::Float32:
    case DType::Float64:
    case DType::Complex64:
    case DType::Complex128:
      return true;
    default:
      return false;
  }
}

bool is_complex(DType dtype) noexcept {
  return dtype == DType::Complex64 || dtype == DType::Complex128;
}

std::string_view dtype_name(DType dtype) noexcept {
  switch (dtype) {
    case DType::Bool:       return "bool";
    case DType::Int8:       return "int8";
    case DType::Int16:      return "int16";
    case DType::Int32:      return "int32";
    case DType::Int64:      return "int64";
    case DType::UInt8:      return "uint8";
    case DType::UInt16:     return "uint16";
    case DType::UInt32:     return "uint32";
    case DType::UInt64:     return "uint64";
    case DType::Float32:    return "float32";
    case DType::Float64:    return "float64";
    case DType::Complex64:  return "complex64";
    case DType::Complex128: return "complex128";
  }
  return "unknown";
}

DType parse_dtype(std::string_view name) {
  if (name == "f32") return DType::Float32;
  if (name == "f64") return DType::Float64;
  if (name == "c64") return DType::Complex64;
  if (name == "c128") return DType::Complex128;
  if (name == "i32") return DType::Int32;
  if (name == "i64") return DType::Int64;

  constexpr DType all[] = {
      DType::Bool,   DType::Int8,    DType::Int16,     DType::Int32,     DType::Int64,
      DType::UInt8,  DType::UInt16,  DType::UInt32,    DType::UInt64,    DType::Float32,
      DType::Float64, DType::Complex64, DType::Complex128};
  for (DType d : all) {
    if (dtype_name(d) == name) return d;
  }
  throw std::invalid_argument("unknown dtype '" + std::string(name) + "'");
}

} // namespace bpath::core
