#include <bpath/core/LeafSampler.h>

#include <cmath>
#include <complex>
#include <random>
#include <variant>
#include <vector>

#if defined(BPATH_USE_BLAS)
  #if defined(__APPLE__)
    #include <Accelerate/Accelerate.h>
  #else
    #include <cblas.h>
  #endif
#endif

namespace bpath::core {

namespace {

template <typename R>
void fill_normal(std::mt19937_64& rng, std::vector<R>& out) {
  std::normal_distribution<R> N01(R(0), R(1));
  for (R& x : out) x = N01(rng);
}

template <typename R>
void fill_normal(std::mt19937_64& rng, std::vector<std::complex<R>>& out) {
  std::normal_distribution<R> half(R(0), std::sqrt(R(0.5)));
  for (std::complex<R>& z : out) {
    // Two statements keep the draw order fixed.
    const R re = half(rng);
    const R im = half(rng);
    z = std::complex<R>(re, im);
  }
}

#if !defined(BPATH_USE_BLAS)
template <typename E, typename R>
void scale_fallback(std::vector<E>& v, R alpha) {
  for (E& x : v) x *= alpha;
}
#endif

} // namespace

Array sample_normal(Key key, const ShapeDtype& spec) {
  Array out(spec);
  std::mt19937_64 rng(key.bits());
  std::visit([&](auto& v) { fill_normal(rng, v); }, out.storage());
  return out;
}

void scale_in_place(Array& a, double factor) {
  auto& data = a.storage();
#if defined(BPATH_USE_BLAS)
  const int n = static_cast<int>(a.size());
  if (n == 0) return;
  if (auto* vf = std::get_if<std::vector<float>>(&data)) {
    cblas_sscal(n, static_cast<float>(factor), vf->data(), 1);
  } else if (auto* vd = std::get_if<std::vector<double>>(&data)) {
    cblas_dscal(n, factor, vd->data(), 1);
  } else if (auto* vc = std::get_if<std::vector<std::complex<float>>>(&data)) {
    cblas_csscal(n, static_cast<float>(factor), vc->data(), 1);
  } else if (auto* vz = std::get_if<std::vector<std::complex<double>>>(&data)) {
    cblas_zdscal(n, factor, vz->data(), 1);
  }
#else
  if (auto* vf = std::get_if<std::vector<float>>(&data)) {
    scale_fallback(*vf, static_cast<float>(factor));
  } else if (auto* vd = std::get_if<std::vector<double>>(&data)) {
    scale_fallback(*vd, factor);
  } else if (auto* vc = std::get_if<std::vector<std::complex<float>>>(&data)) {
    scale_fallback(*vc, static_cast<float>(factor));
  } else if (auto* vz = std::get_if<std::vector<std::complex<double>>>(&data)) {
    scale_fallback(*vz, factor);
  }
#endif
}

Array sample_increment(Key key, const ShapeDtype& spec, double t0, double t1) {
  Array out = sample_normal(key, spec);
  scale_in_place(out, std::sqrt(t1 - t0));
  return out;
}

} // namespace bpath::core
