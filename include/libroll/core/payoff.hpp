#pragma once
#include "libroll/core/types.hpp"

#include <string>

namespace roll::payoff {

double intrinsic(bool is_call, double S, double K);

double intrinsic(OptionKind kind, double S, double K);

// e^(-r t)
double discount_factor(double r, double t);

// Accepts "call" / "put" in any case, throws std::invalid_argument otherwise.
OptionKind parse_option_kind(const std::string& text);

const char* to_string(OptionKind kind);

} // namespace roll::payoff
