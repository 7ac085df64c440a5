#pragma once
#include <cmath>

namespace roll::math {

inline constexpr double kInvSqrt2   = 0.70710678118654752440;
inline constexpr double kInvSqrt2Pi = 0.39894228040143267794;

// Standard normal CDF, accurate in both tails through erfc.
inline double norm_cdf(double x) {
    return 0.5 * std::erfc(-x * kInvSqrt2);
}

inline double norm_pdf(double x) {
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

} // namespace roll::math
