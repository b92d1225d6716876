#include <bpath/core/Array.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <type_traits>
#include <utility>

namespace bpath::core {

namespace {

bool element_is_nan(float v) { return std::isnan(v); }
bool element_is_nan(double v) { return std::isnan(v); }
template <typename R>
bool element_is_nan(const std::complex<R>& v) { return std::isnan(v.real()) || std::isnan(v.imag()); }

} // namespace

Array::Array(ShapeDtype spec) : spec_(std::move(spec)) {
  const std::size_t n = num_elements(spec_.shape);
  switch (spec_.dtype) {
    case DType::Float32:    data_ = std::vector<float>(n, 0.0f); break;
    case DType::Float64:    data_ = std::vector<double>(n, 0.0); break;
    case DType::Complex64:  data_ = std::vector<std::complex<float>>(n); break;
    case DType::Complex128: data_ = std::vector<std::complex<double>>(n); break;
    default:
      throw std::invalid_argument("array dtype must be floating-point, got " +
                                  std::string(dtype_name(spec_.dtype)));
  }
}

std::size_t Array::size() const noexcept {
  return std::visit([](const auto& v) { return v.size(); }, data_);
}

bool Array::identical(const Array& other) const noexcept {
  if (spec_ != other.spec_ || data_.index() != other.data_.index()) return false;
  return std::visit(
      [&](const auto& v) {
        using Vec = std::decay_t<decltype(v)>;
        const auto& w = std::get<Vec>(other.data_);
        if (v.size() != w.size()) return false;
        if (v.empty()) return true;
        return std::memcmp(v.data(), w.data(), v.size() * sizeof(typename Vec::value_type)) == 0;
      },
      data_);
}

bool Array::has_nan() const noexcept {
  return std::visit(
      [](const auto& v) {
        return std::any_of(v.begin(), v.end(), [](const auto& x) { return element_is_nan(x); });
      },
      data_);
}

bool Array::all_nan() const noexcept {
  return std::visit(
      [](const auto& v) {
        return std::all_of(v.begin(), v.end(), [](const auto& x) { return element_is_nan(x); });
      },
      data_);
}

void Array::throw_type_mismatch(DType requested) const {
  throw std::invalid_argument("array holds " + std::string(dtype_name(spec_.dtype)) +
                              ", requested " + std::string(dtype_name(requested)));
}

} // namespace bpath::core
