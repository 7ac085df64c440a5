#pragma once
#include "libroll/core/types.hpp"

#include <optional>

namespace roll::bs {

struct D1D2 {
    double d1, d2;
};

// Theta is per calendar day, vega and rho per 1 percentage point move.
struct Greeks {
    double delta, gamma, theta, vega, rho;
};

struct PriceGreeks {
    double price;
    std::optional<Greeks> greeks; // empty when T <= 0 (not applicable)
};

D1D2 d1_d2(double S, double K, double r, double q, double T, double vol);

// European price; T <= 0 returns intrinsic value.
double price(double S, double K, double r, double q, double T, double vol, bool is_call);

double price(const OptionSpec& spec);

PriceGreeks price_greeks(double S, double K, double r, double q, double T, double vol, bool is_call);

PriceGreeks price_greeks(const OptionSpec& spec);

} // namespace roll::bs
