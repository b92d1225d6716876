#pragma once
#include <optional>
#include <span>
#include <vector>

#include <bpath/core/IBrownianPath.h>
#include <bpath/core/Key.h>
#include <bpath/core/ShapeDtype.h>
#include <bpath/core/Tree.h>

namespace bpath::core {

// What evaluate() does with a reversed interval (t1 < t0).
enum class IntervalPolicy {
  Propagate, // sqrt of a negative length, every element is NaN
  Strict     // std::invalid_argument
};

struct PathOptions {
  IntervalPolicy interval_policy = IntervalPolicy::Propagate;
};

// UnsafeBrownianPath
// ------------------
// Samples a fresh N(0, t1 - t0) value for every queried interval, keyed by the
// bit patterns of the endpoints. No path is stored and queries have no side
// effects, so the same query always returns the same value and queries may
// come in any order or from any thread.
//
// The price: overlapping intervals give independent samples, not values of
// one realised path. Only valid for fixed step sizes where each sub-interval
// is queried once, and without differentiating through the samples.
//
// Endpoints are rounded to single precision before keying, so two times that
// round to the same float share a key.
class UnsafeBrownianPath final : public IBrownianPath {
public:
  // Throws std::invalid_argument naming the first leaf whose dtype is not
  // floating-point.
  UnsafeBrownianPath(Tree<ShapeDtype> shape, Key key, PathOptions options = {});

  // Single array of default_floating_dtype().
  UnsafeBrownianPath(Shape dims, Key key, PathOptions options = {});

  double t0() const override;
  double t1() const override;

  ArrayTree evaluate(double t0,
                     std::optional<double> t1 = std::nullopt,
                     bool left = true) const override;

  // out[i] is bit-identical to evaluate(t0s[i], t1s[i]). Runs in parallel
  // when built with BPATH_USE_OPENMP.
  std::vector<ArrayTree> evaluate_batch(std::span<const double> t0s,
                                        std::span<const double> t1s) const;

  const Tree<ShapeDtype>& shape() const noexcept { return shape_; }
  Key key() const noexcept { return key_; }
  const PathOptions& options() const noexcept { return options_; }

private:
  void check_interval(double t0, double t1) const;

  Tree<ShapeDtype> shape_;
  Key key_;
  PathOptions options_;
};

} // namespace bpath::core
