#pragma once

#include <string>

namespace roll::check {

// Relative tolerances (fractions, 0.01 = 1%) for comparing an external engine
// against recomputed reference values.
struct Tolerance {
    double mean = 0.01;
    double std_dev = 0.05;
    double percentiles = 0.02;
    double ks_pvalue = 0.05;
    double ci_bounds = 0.02;
};

// |actual - expected| / |expected|, or |actual| when expected is zero.
double relative_difference(double actual, double expected);

bool within_tolerance(double actual, double expected, double tolerance);

struct Check {
    std::string label;
    bool passed;
    double forge;
    double reference;
    double relative_diff;
    std::string detail;
};

Check compare(const std::string& label, double forge, double reference, double tolerance);

} // namespace roll::check
