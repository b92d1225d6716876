#pragma once
#include <complex>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <bpath/core/DType.h>
#include <bpath/core/ShapeDtype.h>

namespace bpath::core {

template <typename T> struct dtype_of;
template <> struct dtype_of<float>                { static constexpr DType value = DType::Float32; };
template <> struct dtype_of<double>               { static constexpr DType value = DType::Float64; };
template <> struct dtype_of<std::complex<float>>  { static constexpr DType value = DType::Complex64; };
template <> struct dtype_of<std::complex<double>> { static constexpr DType value = DType::Complex128; };

// Dense row-major buffer of one floating dtype.
class Array {
public:
  using Storage = std::variant<std::vector<float>,
                               std::vector<double>,
                               std::vector<std::complex<float>>,
                               std::vector<std::complex<double>>>;

  // Zero-filled. Throws std::invalid_argument for non-floating dtypes.
  explicit Array(ShapeDtype spec);

  const ShapeDtype& spec() const noexcept { return spec_; }
  const Shape& shape() const noexcept { return spec_.shape; }
  DType dtype() const noexcept { return spec_.dtype; }
  std::size_t size() const noexcept;

  // Throws std::invalid_argument if T does not match dtype().
  template <typename T>
  std::span<const T> values() const {
    const auto* v = std::get_if<std::vector<T>>(&data_);
    if (!v) throw_type_mismatch(dtype_of<T>::value);
    return *v;
  }

  template <typename T>
  std::span<T> values() {
    auto* v = std::get_if<std::vector<T>>(&data_);
    if (!v) throw_type_mismatch(dtype_of<T>::value);
    return *v;
  }

  const Storage& storage() const noexcept { return data_; }
  Storage& storage() noexcept { return data_; }

  // Same shape, dtype and element bit patterns (NaN payloads included).
  bool identical(const Array& other) const noexcept;

  bool has_nan() const noexcept;
  bool all_nan() const noexcept;

private:
  [[noreturn]] void throw_type_mismatch(DType requested) const;

  ShapeDtype spec_;
  Storage data_;
};

} // namespace bpath::core
