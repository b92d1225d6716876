#include <bpath/core/GBM_Euler.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace bpath::core {

namespace {

// Copies a real increment leaf into dW as double.
void read_increments(const Array& leaf, std::vector<double>& dW) {
  if (leaf.size() != dW.size()) {
    throw std::invalid_argument("Brownian leaf size must equal m_paths");
  }
  if (leaf.dtype() == DType::Float64) {
    const auto v = leaf.values<double>();
    for (std::size_t p = 0; p < v.size(); ++p) dW[p] = v[p];
  } else if (leaf.dtype() == DType::Float32) {
    const auto v = leaf.values<float>();
    for (std::size_t p = 0; p < v.size(); ++p) dW[p] = static_cast<double>(v[p]);
  } else {
    throw std::invalid_argument("Brownian leaf must be real (float32 or float64)");
  }
}

} // namespace

GBM_Euler::GBM_Euler(double mu, double sigma) : mu_(mu), sigma_(sigma) {
  if (sigma_ < 0.0) {
    throw std::invalid_argument("Volatility sigma must be non-negative");
  }
}

void GBM_Euler::evolve(const IBrownianPath& path,
                       std::span<const double> time,
                       std::size_t m_paths,
                       double S0,
                       std::span<double> S_out) const {
  if (time.size() < 2) {
    throw std::invalid_argument("time grid must have at least 2 points");
  }
  const std::size_t N = time.size() - 1;
  for (std::size_t i = 0; i < N; ++i) {
    if (!(time[i + 1] > time[i])) {
      throw std::invalid_argument("time grid must be strictly increasing");
    }
  }
  if (S_out.size() != m_paths * (N + 1)) {
    throw std::invalid_argument("S_out must have size m_paths * (N + 1)");
  }
  if (S0 <= 0.0) {
    throw std::invalid_argument("S0 must be positive");
  }

  std::vector<double> log_S(m_paths, std::log(S0));
  std::vector<double> dW(m_paths);

  for (std::size_t path_idx = 0; path_idx < m_paths; ++path_idx) {
    S_out[path_idx * (N + 1)] = S0;
  }

  // dlog(S) = (mu - 0.5*sigma^2)*dt + sigma*dW
  for (std::size_t step = 0; step < N; ++step) {
    const double dt = time[step + 1] - time[step];
    const double drift = (mu_ - 0.5 * sigma_ * sigma_) * dt;

    const ArrayTree increment = path.evaluate(time[step], time[step + 1]);
    read_increments(increment.value(), dW);

    for (std::size_t p = 0; p < m_paths; ++p) {
      log_S[p] += drift + sigma_ * dW[p];
      S_out[p * (N + 1) + step + 1] = std::exp(log_S[p]);
    }
  }
}

} // namespace bpath::core
