#pragma once
#include <cstddef>
#include <span>

#include <bpath/core/IBrownianPath.h>

namespace bpath::core {

/// GBM_Euler
/// ---------
/// Log-Euler integration of dS = mu*S*dt + sigma*S*dW driven by any
/// IBrownianPath. Each step interval [t_i, t_{i+1}] is queried exactly once,
/// which is the access pattern UnsafeBrownianPath is valid for.
/// Inputs:
/// - path: single real leaf (float32 or float64) with m_paths elements,
///   one independent Brownian motion per path
/// - time: size N+1, strictly increasing (need not be uniform)
/// - S0: initial spot
/// Output:
/// - S_out: size m_paths*(N+1), path-major (S_out[p*(N+1)+i])
class GBM_Euler final {
public:
  GBM_Euler(double mu, double sigma);

  void evolve(const IBrownianPath& path,
              std::span<const double> time,
              std::size_t m_paths,
              double S0,
              std::span<double> S_out) const;

private:
  double mu_;
  double sigma_;
};

} // namespace bpath::core
