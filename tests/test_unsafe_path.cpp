#include <catch2/catch.hpp>

#include <bpath/core/IBrownianPath.h>
#include <bpath/core/Key.h>
#include <bpath/core/UnsafeBrownianPath.h>

#include <cmath>
#include <complex>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bpath::core;
using Desc = Tree<ShapeDtype>;

namespace {

bool trees_identical(const ArrayTree& a, const ArrayTree& b) {
    if (!a.same_structure(b)) return false;
    const auto x = a.leaves();
    const auto y = b.leaves();
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!x[i].identical(y[i])) return false;
    }
    return true;
}

double sample_variance(const std::vector<double>& v) {
    double sum = 0.0, sumsq = 0.0;
    for (double x : v) { sum += x; sumsq += x * x; }
    const double n = static_cast<double>(v.size());
    const double mean = sum / n;
    return (sumsq - n * mean * mean) / (n - 1.0);
}

double correlation(std::span<const double> a, std::span<const double> b) {
    const double n = static_cast<double>(a.size());
    double ma = 0.0, mb = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) { ma += a[i]; mb += b[i]; }
    ma /= n; mb /= n;
    double cov = 0.0, va = 0.0, vb = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        cov += (a[i] - ma) * (b[i] - mb);
        va += (a[i] - ma) * (a[i] - ma);
        vb += (b[i] - mb) * (b[i] - mb);
    }
    return cov / std::sqrt(va * vb);
}

} // namespace

TEST_CASE("repeated queries return identical values", "[path]") {
    const UnsafeBrownianPath path(Shape{3}, Key(42));

    const ArrayTree a = path.evaluate(0.0, 1.0);
    const ArrayTree b = path.evaluate(0.0, 1.0);

    REQUIRE(a.is_leaf());
    REQUIRE(a.value().shape() == Shape{3});
    REQUIRE(a.value().dtype() == default_floating_dtype());
    REQUIRE(trees_identical(a, b));
}

TEST_CASE("independent constructions with the same key agree", "[path]") {
    const Desc desc = Desc::mapping({
        {"x", Desc::leaf({{5}, DType::Float32})},
        {"y", Desc::leaf({{2, 2}, DType::Complex128})},
    });
    const UnsafeBrownianPath p1(desc, Key(9));
    const UnsafeBrownianPath p2(desc, Key(9));

    REQUIRE(trees_identical(p1.evaluate(-3.5, 2.25), p2.evaluate(-3.5, 2.25)));
    REQUIRE(trees_identical(p1.evaluate(0.125), p2.evaluate(0.125)));
}

TEST_CASE("different keys or intervals give different samples", "[path]") {
    const UnsafeBrownianPath path(Shape{3}, Key(42));
    const UnsafeBrownianPath other(Shape{3}, Key(43));

    REQUIRE_FALSE(trees_identical(path.evaluate(0.0, 1.0), path.evaluate(1.0, 2.0)));
    REQUIRE_FALSE(trees_identical(path.evaluate(0.0, 1.0), other.evaluate(0.0, 1.0)));
}

TEST_CASE("unit intervals have unit variance", "[path]") {
    const std::size_t P = 50000;
    const UnsafeBrownianPath path(Shape{P}, Key(42));

    for (double start : {0.0, 1.0}) {
        const ArrayTree r = path.evaluate(start, start + 1.0);
        const auto v = r.value().values<double>();
        const double var = sample_variance(std::vector<double>(v.begin(), v.end()));
        REQUIRE(std::abs(var - 1.0) < 5.0 * std::sqrt(2.0 / double(P)));
    }
}

TEST_CASE("a single argument is the increment from time zero", "[path]") {
    const UnsafeBrownianPath path(Shape{3}, Key(42));

    REQUIRE(trees_identical(path.evaluate(0.5), path.evaluate(0.0, 0.5)));
    REQUIRE(trees_identical(path.evaluate(-2.0), path.evaluate(0.0, -2.0)));
    REQUIRE_FALSE(trees_identical(path.evaluate(0.5), path.evaluate(0.5, 1.0)));
}

TEST_CASE("the left flag has no effect", "[path]") {
    const UnsafeBrownianPath path(Shape{4}, Key(1));

    REQUIRE(trees_identical(path.evaluate(0.2, 0.7, true), path.evaluate(0.2, 0.7, false)));
    REQUIRE(trees_identical(path.evaluate(0.7, std::nullopt, false), path.evaluate(0.7)));
}

TEST_CASE("nested descriptors are reproduced leaf by leaf", "[path]") {
    SECTION("two keyed leaves") {
        const Desc desc = Desc::mapping({
            {"a", Desc::leaf({{2}, default_floating_dtype()})},
            {"b", Desc::leaf({{4}, default_floating_dtype()})},
        });
        const UnsafeBrownianPath path(desc, Key(42));
        const ArrayTree r = path.evaluate(0.0, 1.0);

        REQUIRE(r.keys() == std::vector<std::string>{"a", "b"});
        REQUIRE(r.at("a").value().shape() == Shape{2});
        REQUIRE(r.at("b").value().shape() == Shape{4});

        // The leaves come from different sub-keys: "a" is not a prefix of "b"
        const auto a = r.at("a").value().values<double>();
        const auto b = r.at("b").value().values<double>();
        REQUIRE_FALSE((a[0] == b[0] && a[1] == b[1]));
    }

    SECTION("deep mixed nesting") {
        const Desc desc = Desc::sequence({
            Desc::mapping({
                {"drift", Desc::leaf({{2, 3}, DType::Float32})},
                {"inner", Desc::sequence({Desc::leaf({{}, DType::Complex64}),
                                          Desc::mapping({{"deep", Desc::leaf({{1, 1, 2}, DType::Float64})}})})},
            }),
            Desc::leaf({{0}, DType::Float64}),
        });
        const UnsafeBrownianPath path(desc, Key(77));
        const ArrayTree r = path.evaluate(0.25, 0.75);

        REQUIRE(r.same_structure(desc));
        const auto specs = desc.leaves();
        const auto values = r.leaves();
        REQUIRE(values.size() == specs.size());
        for (std::size_t i = 0; i < specs.size(); ++i) {
            REQUIRE(values[i].spec() == specs[i]);
            REQUIRE(values[i].size() == num_elements(specs[i].shape));
        }
        REQUIRE(r[0].at("inner")[1].at("deep").value().dtype() == DType::Float64);
    }
}

TEST_CASE("leaves within one query are uncorrelated", "[path]") {
    const std::size_t P = 40000;
    const Desc desc = Desc::mapping({
        {"u", Desc::leaf({{P}, DType::Float64})},
        {"v", Desc::leaf({{P}, DType::Float64})},
    });
    const UnsafeBrownianPath path(desc, Key(5));
    const ArrayTree r = path.evaluate(0.0, 1.0);

    const double rho = correlation(r.at("u").value().values<double>(), r.at("v").value().values<double>());
    REQUIRE(std::abs(rho) < 5.0 / std::sqrt(double(P)));
}

TEST_CASE("queries with different intervals are uncorrelated", "[path]") {
    const std::size_t P = 40000;
    const UnsafeBrownianPath path(Shape{P}, Key(6));

    const ArrayTree a = path.evaluate(0.0, 1.0);
    const ArrayTree b = path.evaluate(1.0, 2.0);
    // Overlapping intervals are sampled independently too
    const ArrayTree c = path.evaluate(0.0, 0.5);

    const double rho_ab = correlation(a.value().values<double>(), b.value().values<double>());
    const double rho_ac = correlation(a.value().values<double>(), c.value().values<double>());
    REQUIRE(std::abs(rho_ab) < 5.0 / std::sqrt(double(P)));
    REQUIRE(std::abs(rho_ac) < 5.0 / std::sqrt(double(P)));
}

TEST_CASE("variance scales linearly with the interval length", "[path]") {
    const std::size_t width = 16;
    const std::size_t n_intervals = 2000;
    const UnsafeBrownianPath path(Shape{width}, Key(2718));

    for (double delta : {0.01, 0.1, 1.0, 4.0}) {
        // Disjoint intervals [k*delta, (k+1)*delta]
        std::vector<double> samples;
        samples.reserve(width * n_intervals);
        for (std::size_t k = 0; k < n_intervals; ++k) {
            const double start = delta * static_cast<double>(k);
            const ArrayTree r = path.evaluate(start, start + delta);
            for (double x : r.value().values<double>()) samples.push_back(x);
        }
        const double ratio = sample_variance(samples) / delta;
        // SE(ratio) = sqrt(2/32000) ~ 0.008
        REQUIRE(std::abs(ratio - 1.0) < 0.05);
    }
}

TEST_CASE("non-floating leaves are rejected at construction", "[path]") {
    SECTION("single leaf") {
        REQUIRE_THROWS_AS(UnsafeBrownianPath(Desc::leaf({{3}, DType::Int32}), Key(1)), std::invalid_argument);
    }

    SECTION("nested leaf is named in the message") {
        const Desc desc = Desc::mapping({
            {"a", Desc::leaf({{2}, DType::Float64})},
            {"b", Desc::sequence({Desc::leaf({{4}, DType::Float32}), Desc::leaf({{4}, DType::Int64})})},
        });
        try {
            const UnsafeBrownianPath path(desc, Key(1));
            FAIL("construction should have thrown");
        } catch (const std::invalid_argument& e) {
            const std::string msg = e.what();
            REQUIRE(msg.find("['b'][1]") != std::string::npos);
            REQUIRE(msg.find("int64") != std::string::npos);
        }
    }

    SECTION("bool leaf") {
        REQUIRE_THROWS_AS(UnsafeBrownianPath(Desc::leaf({{}, DType::Bool}), Key(1)), std::invalid_argument);
    }
}

TEST_CASE("reversed intervals", "[path]") {
    SECTION("propagate NaN by default") {
        const UnsafeBrownianPath path(Shape{3}, Key(42));
        const ArrayTree r = path.evaluate(1.0, 0.5);

        REQUIRE(r.value().shape() == Shape{3});
        REQUIRE(r.value().all_nan());
    }

    SECTION("throw under the strict policy") {
        PathOptions options;
        options.interval_policy = IntervalPolicy::Strict;
        const UnsafeBrownianPath path(Shape{3}, Key(42), options);

        REQUIRE_THROWS_AS(path.evaluate(1.0, 0.5), std::invalid_argument);
        REQUIRE_THROWS_AS(path.evaluate(-1.0), std::invalid_argument);
        REQUIRE_NOTHROW(path.evaluate(0.5, 1.0));
        REQUIRE_NOTHROW(path.evaluate(0.5, 0.5));
    }
}

TEST_CASE("the declared domain is the whole real line", "[path]") {
    const UnsafeBrownianPath path(Shape{1}, Key(0));
    const IBrownianPath& base = path;

    REQUIRE(base.t0() == -std::numeric_limits<double>::infinity());
    REQUIRE(base.t1() == std::numeric_limits<double>::infinity());
}

TEST_CASE("the interface dispatches to the unsafe sampler", "[path]") {
    const UnsafeBrownianPath path(Shape{6}, Key(31));
    const IBrownianPath& base = path;

    REQUIRE(trees_identical(base.evaluate(0.1, 0.2), path.evaluate(0.1, 0.2)));
    REQUIRE(trees_identical(base.evaluate(0.3), path.evaluate(0.0, 0.3)));
}

TEST_CASE("batch evaluation matches one-by-one evaluation", "[path][batch]") {
    const Desc desc = Desc::mapping({
        {"w", Desc::leaf({{8}, DType::Float64})},
        {"z", Desc::leaf({{3}, DType::Complex64})},
    });
    const UnsafeBrownianPath path(desc, Key(123));

    std::vector<double> t0s, t1s;
    for (std::size_t i = 0; i < 257; ++i) {
        t0s.push_back(0.01 * static_cast<double>(i));
        t1s.push_back(0.01 * static_cast<double>(i + 1));
    }

    const auto batch = path.evaluate_batch(t0s, t1s);
    REQUIRE(batch.size() == t0s.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
        REQUIRE(trees_identical(batch[i], path.evaluate(t0s[i], t1s[i])));
    }

    REQUIRE(path.evaluate_batch({}, {}).empty());

    const std::vector<double> short_t1s(3, 1.0);
    REQUIRE_THROWS_AS(path.evaluate_batch(t0s, short_t1s), std::invalid_argument);
}

TEST_CASE("batch evaluation honours the strict policy", "[path][batch]") {
    PathOptions options;
    options.interval_policy = IntervalPolicy::Strict;
    const UnsafeBrownianPath path(Shape{2}, Key(8), options);

    const std::vector<double> t0s{0.0, 1.0, 2.0};
    const std::vector<double> t1s{1.0, 0.5, 3.0};
    REQUIRE_THROWS_AS(path.evaluate_batch(t0s, t1s), std::invalid_argument);
}
