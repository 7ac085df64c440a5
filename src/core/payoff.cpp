#include "libroll/core/payoff.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace roll::payoff {

double intrinsic(bool is_call, double S, double K) {
    return is_call ? std::max(0.0, S - K) : std::max(0.0, K - S);
}

double intrinsic(OptionKind kind, double S, double K) {
    return intrinsic(kind == OptionKind::Call, S, K);
}

double discount_factor(double r, double t) {
    return std::exp(-r * t);
}

OptionKind parse_option_kind(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "call") return OptionKind::Call;
    if (lower == "put") return OptionKind::Put;
    throw std::invalid_argument("unknown option type '" + text + "' (expected call or put)");
}

const char* to_string(OptionKind kind) {
    return kind == OptionKind::Call ? "call" : "put";
}

} // namespace roll::payoff
