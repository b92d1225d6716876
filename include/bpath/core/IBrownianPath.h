#pragma once
#include <optional>

#include <bpath/core/Array.h>
#include <bpath/core/Tree.h>

namespace bpath::core {

using ArrayTree = Tree<Array>;

struct IBrownianPath {
  virtual ~IBrownianPath() = default;
  // Interval on which evaluate() is valid.
  virtual double t0() const = 0;
  virtual double t1() const = 0;
  // Increment over [t0, t1]; with t1 omitted, the increment over [0, t0].
  // left selects the left limit at a jump for paths that have jumps.
  virtual ArrayTree evaluate(double t0,
                             std::optional<double> t1 = std::nullopt,
                             bool left = true) const = 0;
};

} // namespace bpath::core
