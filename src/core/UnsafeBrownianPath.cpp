#include <bpath/core/UnsafeBrownianPath.h>

#include <exception>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <bpath/core/LeafSampler.h>

namespace bpath::core {

namespace {

void validate_dtypes(const Tree<ShapeDtype>& shape) {
  shape.for_each_leaf_with_path([](const std::string& path, const ShapeDtype& leaf) {
    if (!is_floating(leaf.dtype)) {
      throw std::invalid_argument(
          "UnsafeBrownianPath dtypes all have to be floating-point: leaf " +
          (path.empty() ? std::string("<root>") : path) + " has dtype " +
          std::string(dtype_name(leaf.dtype)));
    }
  });
}

} // namespace

UnsafeBrownianPath::UnsafeBrownianPath(Tree<ShapeDtype> shape, Key key, PathOptions options)
    : shape_(std::move(shape)), key_(key), options_(options) {
  validate_dtypes(shape_);
}

UnsafeBrownianPath::UnsafeBrownianPath(Shape dims, Key key, PathOptions options)
    : UnsafeBrownianPath(Tree<ShapeDtype>::leaf(ShapeDtype{std::move(dims), default_floating_dtype()}),
                         key, options) {}

double UnsafeBrownianPath::t0() const {
  return -std::numeric_limits<double>::infinity();
}

double UnsafeBrownianPath::t1() const {
  return std::numeric_limits<double>::infinity();
}

void UnsafeBrownianPath::check_interval(double t0, double t1) const {
  if (options_.interval_policy == IntervalPolicy::Strict && t1 < t0) {
    throw std::invalid_argument("interval end must not precede its start");
  }
}

ArrayTree UnsafeBrownianPath::evaluate(double t0, std::optional<double> t1, bool /*left*/) const {
  const double a = t1 ? t0 : 0.0;
  const double b = t1 ? *t1 : t0;
  check_interval(a, b);

  const Key interval_key = derive_interval_key(key_, a, b);
  const Tree<Key> leaf_keys = split_by_tree(interval_key, shape_);
  return leaf_keys.zip_map(shape_, [a, b](const Key& k, const ShapeDtype& leaf) {
    return sample_increment(k, leaf, a, b);
  });
}

std::vector<ArrayTree> UnsafeBrownianPath::evaluate_batch(std::span<const double> t0s,
                                                          std::span<const double> t1s) const {
  if (t0s.size() != t1s.size()) {
    throw std::invalid_argument("t0s and t1s must have the same size");
  }
  const std::size_t n = t0s.size();
  for (std::size_t i = 0; i < n; ++i) check_interval(t0s[i], t1s[i]);

  std::vector<std::optional<ArrayTree>> slots(n);
  std::exception_ptr error;

#if defined(BPATH_USE_OPENMP)
  #pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < n; ++i) {
    try {
      slots[i].emplace(evaluate(t0s[i], t1s[i]));
    } catch (...) {
#if defined(BPATH_USE_OPENMP)
      #pragma omp critical(bpath_batch_error)
#endif
      {
        if (!error) error = std::current_exception();
      }
    }
  }
  if (error) std::rethrow_exception(error);

  std::vector<ArrayTree> out;
  out.reserve(n);
  for (auto& s : slots) out.push_back(std::move(*s));
  return out;
}

} // namespace bpath::core
