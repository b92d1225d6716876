#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <cmath>
#include <complex>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <numeric>
#include <stdexcept>

#include <bpath/core/DType.h>
#include <bpath/core/ShapeDtype.h>
#include <bpath/core/Key.h>
#include <bpath/core/Array.h>
#include <bpath/core/IBrownianPath.h>
#include <bpath/core/UnsafeBrownianPath.h>
#include <bpath/core/GBM_Euler.h>

#if defined(BPATH_USE_OPENMP)
#include <omp.h>
#endif

struct CLIArgs {
  std::string command;
  double t0 = 0.0;
  double t1 = 1.0;
  bool has_t1 = false;
  std::uint64_t seed = 42;
  bpath::core::Shape shape{3};
  bpath::core::DType dtype = bpath::core::default_floating_dtype();
  bool strict = false;
  std::size_t n_intervals = 10000;
  double dt = 0.01;
  std::size_t n_paths = 10000;
  std::size_t n_steps = 252;
  double T = 1.0;
  double S0 = 100.0;
  double mu = 0.0;
  double sigma = 0.2;
  bool show_help = false;
  int threads = 0; // 0 = library default
};

static void printUsage() {
  std::cout << "Usage: bpath_cli <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  evaluate      Sample one Brownian increment\n";
  std::cout << "  stats         Variance of increments over many disjoint intervals\n";
  std::cout << "  gbm           Fixed-step Euler GBM driven by the sampler\n\n";
  std::cout << "Common options:\n";
  std::cout << "  --seed N      Key seed\n";
  std::cout << "  --shape D,..  Leaf dimensions, e.g. 3 or 2,4 (empty = scalar)\n";
#if defined(BPATH_USE_OPENMP)
  std::cout << "  --threads N   OpenMP threads (0 = lib default)\n";
#endif
  std::cout << "  --help        Show this help message\n\n";

  std::cout << "Evaluate options:\n";
  std::cout << "  --t0 VALUE    Interval start (the end if --t1 is omitted)\n";
  std::cout << "  --t1 VALUE    Interval end\n";
  std::cout << "  --dtype NAME  f32, f64, c64 or c128 (default: f64)\n";
  std::cout << "  --strict      Reject t1 < t0 instead of returning NaN\n\n";

  std::cout << "Stats options:\n";
  std::cout << "  --nintervals N  Number of disjoint intervals\n";
  std::cout << "  --dt VALUE      Interval length\n\n";

  std::cout << "GBM options:\n";
  std::cout << "  --npaths N    Number of paths\n";
  std::cout << "  --nsteps N    Number of time steps\n";
  std::cout << "  --T VALUE     Time horizon (default: 1.0)\n";
  std::cout << "  --S0 VALUE    Initial price (default: 100.0)\n";
  std::cout << "  --mu VALUE    Drift (default: 0.0)\n";
  std::cout << "  --sigma VALUE Volatility (default: 0.2)\n";
}

static bpath::core::Shape parseShape(const std::string& text) {
  bpath::core::Shape shape;
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t comma = text.find(',', start);
    const std::string item = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    if (!item.empty()) shape.push_back(std::stoull(item));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return shape;
}

static CLIArgs parseArgs(int argc, char* argv[]) {
  CLIArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  const std::string command = argv[1];
  if (command != "evaluate" && command != "stats" && command != "gbm") {
    std::cerr << "Error: Unknown command '" << command << "'\n";
    args.show_help = true;
    return args;
  }
  args.command = command;

  // Command-specific defaults
  if (command == "stats") {
    args.shape = {64};
    args.seed = 7;
  } else if (command == "gbm") {
    args.seed = 7;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    auto need = [&](int k=1){ return i + k < argc; };

    if (arg == "--help") { args.show_help = true; return args; }
    else if (arg == "--t0" && need())         { args.t0 = std::stod(argv[++i]); }
    else if (arg == "--t1" && need())         { args.t1 = std::stod(argv[++i]); args.has_t1 = true; }
    else if (arg == "--seed" && need())       { args.seed = std::stoull(argv[++i]); }
    else if (arg == "--shape" && need())      { args.shape = parseShape(argv[++i]); }
    else if (arg == "--dtype" && need())      { args.dtype = bpath::core::parse_dtype(argv[++i]); }
    else if (arg == "--strict")               { args.strict = true; }
    else if (arg == "--nintervals" && need()) { args.n_intervals = std::stoull(argv[++i]); }
    else if (arg == "--dt" && need())         { args.dt = std::stod(argv[++i]); }
    else if (arg == "--npaths" && need())     { args.n_paths = std::stoull(argv[++i]); }
    else if (arg == "--nsteps" && need())     { args.n_steps = std::stoull(argv[++i]); }
    else if (arg == "--T" && need())          { args.T = std::stod(argv[++i]); }
    else if (arg == "--S0" && need())         { args.S0 = std::stod(argv[++i]); }
    else if (arg == "--mu" && need())         { args.mu = std::stod(argv[++i]); }
    else if (arg == "--sigma" && need())      { args.sigma = std::stod(argv[++i]); }
#if defined(BPATH_USE_OPENMP)
    else if (arg == "--threads" && need())    { args.threads = std::stoi(argv[++i]); }
#endif
    else {
      std::cerr << "Error: Unknown or incomplete argument '" << arg << "'\n";
      args.show_help = true;
      return args;
    }
  }

  return args;
}

static void printLeaf(const bpath::core::Array& leaf) {
  using bpath::core::DType;
  std::cout << "[";
  for (std::size_t i = 0; i < leaf.size(); ++i) {
    if (i > 0) std::cout << ", ";
    switch (leaf.dtype()) {
      case DType::Float32:    std::cout << leaf.values<float>()[i]; break;
      case DType::Float64:    std::cout << leaf.values<double>()[i]; break;
      case DType::Complex64:  std::cout << leaf.values<std::complex<float>>()[i]; break;
      case DType::Complex128: std::cout << leaf.values<std::complex<double>>()[i]; break;
      default: break;
    }
  }
  std::cout << "]\n";
}

static void runEvaluate(const CLIArgs& args) {
  try {
    bpath::core::PathOptions options;
    if (args.strict) options.interval_policy = bpath::core::IntervalPolicy::Strict;

    const auto descriptor = bpath::core::Tree<bpath::core::ShapeDtype>::leaf({args.shape, args.dtype});
    const bpath::core::UnsafeBrownianPath path(descriptor, bpath::core::Key(args.seed), options);

    const auto result = args.has_t1 ? path.evaluate(args.t0, args.t1) : path.evaluate(args.t0);
    const double a = args.has_t1 ? args.t0 : 0.0;
    const double b = args.has_t1 ? args.t1 : args.t0;

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Brownian Increment\n";
    std::cout << "==================\n";
    std::cout << "Interval: [" << a << ", " << b << "]\n";
    std::cout << "Shape: " << bpath::core::shape_to_string(args.shape)
              << ", dtype: " << bpath::core::dtype_name(args.dtype) << "\n";
    std::cout << "Seed: " << args.seed << "\n\n";
    printLeaf(result.value());
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    std::exit(1);
  }
}

static void runStats(const CLIArgs& args) {
  try {
    if (args.n_intervals < 2) throw std::invalid_argument("nintervals must be at least 2");
    if (args.dt <= 0.0) throw std::invalid_argument("dt must be positive");

    const bpath::core::UnsafeBrownianPath path(args.shape, bpath::core::Key(args.seed));

    std::vector<double> t0s(args.n_intervals), t1s(args.n_intervals);
    for (std::size_t i = 0; i < args.n_intervals; ++i) {
      t0s[i] = args.dt * static_cast<double>(i);
      t1s[i] = args.dt * static_cast<double>(i + 1);
    }

    const auto start = std::chrono::high_resolution_clock::now();
    const auto results = path.evaluate_batch(t0s, t1s);
    const auto stop = std::chrono::high_resolution_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(stop - start).count();

    double sum = 0.0, sumsq = 0.0;
    std::size_t count = 0;
    for (const auto& r : results) {
      for (double v : r.value().values<double>()) {
        sum += v;
        sumsq += v * v;
        ++count;
      }
    }
    if (count < 2) throw std::invalid_argument("shape must have at least one element");
    const double mean = sum / static_cast<double>(count);
    const double var = (sumsq - static_cast<double>(count) * mean * mean) / static_cast<double>(count - 1);

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Increment Statistics\n";
    std::cout << "====================\n";
    std::cout << "Intervals: " << args.n_intervals << ", dt: " << args.dt
              << ", Shape: " << bpath::core::shape_to_string(args.shape) << "\n";
    std::cout << "Seed: " << args.seed << "\n\n";
    std::cout << "Elapsed time: " << ms << " ms\n";
    std::cout << "Samples: " << count << "\n";
    std::cout << "Mean: " << mean << " (theory 0)\n";
    std::cout << "Variance: " << var << " (theory " << args.dt << ")\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    std::exit(1);
  }
}

static void runGBM(const CLIArgs& args) {
  try {
    if (args.n_steps < 1) throw std::invalid_argument("nsteps must be at least 1");
    if (args.T <= 0.0) throw std::invalid_argument("T must be positive");
    if (args.n_paths < 1) throw std::invalid_argument("npaths must be at least 1");

    std::vector<double> time(args.n_steps + 1);
    for (std::size_t i = 0; i <= args.n_steps; ++i) {
      time[i] = args.T * static_cast<double>(i) / static_cast<double>(args.n_steps);
    }

    const bpath::core::UnsafeBrownianPath path(bpath::core::Shape{args.n_paths},
                                               bpath::core::Key(args.seed));
    const bpath::core::GBM_Euler evolver(args.mu, args.sigma);

    std::vector<double> S_out(args.n_paths * (args.n_steps + 1));
    const auto start = std::chrono::high_resolution_clock::now();
    evolver.evolve(path, time, args.n_paths, args.S0, S_out);
    const auto stop = std::chrono::high_resolution_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(stop - start).count();

    std::vector<double> final_prices(args.n_paths);
    for (std::size_t p = 0; p < args.n_paths; ++p) {
      final_prices[p] = S_out[p * (args.n_steps + 1) + args.n_steps];
    }
    const double mean_final =
        std::accumulate(final_prices.begin(), final_prices.end(), 0.0) / static_cast<double>(args.n_paths);

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "GBM Euler Results\n";
    std::cout << "=================\n";
    std::cout << "Paths: " << args.n_paths << ", Steps: " << args.n_steps << "\n";
    std::cout << "S0: " << args.S0 << ", mu: " << args.mu << ", sigma: " << args.sigma
              << ", T: " << args.T << "\n";
    std::cout << "Seed: " << args.seed << "\n\n";
    std::cout << "Elapsed time: " << ms << " ms\n";
    std::cout << "Mean final price: " << mean_final << "\n";
    std::cout << "Expected final price: " << args.S0 * std::exp(args.mu * args.T) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    std::exit(1);
  }
}

int main(int argc, char* argv[]) {
  CLIArgs args;
  try {
    args = parseArgs(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  if (args.show_help) {
    printUsage();
    return 0;
  }

#if defined(BPATH_USE_OPENMP)
  if (args.threads > 0) omp_set_num_threads(args.threads);
#endif

  if (args.command == "evaluate") {
    runEvaluate(args);
  } else if (args.command == "stats") {
    runStats(args);
  } else if (args.command == "gbm") {
    runGBM(args);
  }
  return 0;
}
