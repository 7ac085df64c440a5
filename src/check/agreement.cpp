#include "libroll/check/agreement.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace roll::check {

namespace {

bool near_zero(double x) {
    return std::abs(x) < std::numeric_limits<double>::epsilon();
}

} // namespace

double relative_difference(double actual, double expected) {
    if (near_zero(expected)) {
        return std::abs(actual);
    }
    return std::abs(actual - expected) / std::abs(expected);
}

bool within_tolerance(double actual, double expected, double tolerance) {
    if (!std::isfinite(actual) || !std::isfinite(expected)) {
        return false;
    }
    return relative_difference(actual, expected) <= tolerance;
}

Check compare(const std::string& label, double forge, double reference, double tolerance) {
    const bool ok = within_tolerance(forge, reference, tolerance);
    const double diff = relative_difference(forge, reference);

    std::ostringstream detail;
    detail << std::fixed << std::setprecision(6);
    if (ok) {
        detail << label << " within tolerance: forge=" << forge << ", reference=" << reference;
    } else {
        detail << label << " mismatch: forge=" << forge << ", reference=" << reference
               << std::setprecision(2) << ", tolerance=" << tolerance * 100.0 << "%";
    }
    return {label, ok, forge, reference, diff, detail.str()};
}

} // namespace roll::check
