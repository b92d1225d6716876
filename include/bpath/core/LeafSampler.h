#pragma once

#include <bpath/core/Array.h>
#include <bpath/core/Key.h>
#include <bpath/core/ShapeDtype.h>

namespace bpath::core {

    /// sample_normal
    /// -------------
    /// Standard-normal array of the given shape and dtype, a pure function of
    /// (key, spec). The engine is a std::mt19937_64 seeded from the key and
    /// discarded afterwards; nothing outlives the call.
    ///
    /// Complex dtypes draw the real and imaginary parts independently with
    /// variance 1/2 each, so E|z|^2 = 1.
    ///
    /// Throws std::invalid_argument for non-floating dtypes.
    Array sample_normal(Key key, const ShapeDtype& spec);

    /// Multiplies every element by factor, cast to the array's real precision.
    /// Uses the BLAS ?scal routines when built with BPATH_USE_BLAS.
    void scale_in_place(Array& a, double factor);

    /// Brownian increment over [t0, t1]: sample_normal(key, spec) * sqrt(t1 - t0).
    /// The square root is taken in double and then cast to the leaf precision.
    /// For t1 < t0 the factor is NaN and so is every element of the result.
    Array sample_increment(Key key, const ShapeDtype& spec, double t0, double t1);

} // namespace bpath::core
