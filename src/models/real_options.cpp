#include "libroll/models/real_options.hpp"

#include "libroll/models/black_scholes.hpp"

#include <algorithm>
#include <stdexcept>

namespace roll::real {

DelayValue option_to_delay(double V, double I, double r, double sigma, double T, double q) {
    const double value = bs::price(V, I, r, q, T, sigma, true);
    const double npv_now = V - I;
    return {value, npv_now, value - std::max(npv_now, 0.0)};
}

ExpandValue option_to_expand(double V, double expansion_cost, double expansion_factor,
                             double r, double sigma, double T, double q) {
    if (!(expansion_factor > 1.0)) {
        throw std::invalid_argument("option_to_expand: expansion factor must exceed 1");
    }
    const double additional = V * (expansion_factor - 1.0);
    const double value = bs::price(additional, expansion_cost, r, q, T, sigma, true);
    return {value, additional, expansion_cost};
}

AbandonValue option_to_abandon(double V, double salvage_value, double r, double sigma, double T, double q) {
    const double value = bs::price(V, salvage_value, r, q, T, sigma, false);
    return {value, salvage_value, V};
}

} // namespace roll::real
