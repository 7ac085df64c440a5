#include "libroll/models/black_scholes.hpp"

#include "libroll/core/payoff.hpp"
#include "libroll/math/normal.hpp"
#include "libroll/support/trace.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace roll::bs {

namespace {

void check_inputs(double S, double K, double r, double q, double T, double vol) {
    if (!std::isfinite(S) || !std::isfinite(K) || !std::isfinite(r) ||
        !std::isfinite(q) || !std::isfinite(T) || !std::isfinite(vol)) {
        ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_CLOSED_FORM, 0.0);
        throw std::invalid_argument("black-scholes: inputs must be finite");
    }
    if (!(S > 0.0) || !(K > 0.0)) {
        ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_CLOSED_FORM, S > 0.0 ? K : S);
        throw std::invalid_argument("black-scholes: spot and strike must be positive");
    }
    if (T > 0.0 && !(vol > 0.0)) {
        ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_CLOSED_FORM, vol);
        throw std::domain_error("black-scholes: volatility must be positive");
    }
}

double checked(double value, const char* what) {
    if (!std::isfinite(value)) {
        throw std::domain_error(std::string("black-scholes: ") + what + " is not finite");
    }
    return value;
}

void check_european(const OptionSpec& spec) {
    if (spec.is_american()) {
        throw std::invalid_argument("black-scholes: closed form prices European exercise only");
    }
}

} // namespace

D1D2 d1_d2(double S, double K, double r, double q, double T, double vol) {
    check_inputs(S, K, r, q, T, vol);
    if (!(T > 0.0)) {
        throw std::domain_error("black-scholes: d1/d2 undefined for T <= 0");
    }
    const double vs = vol * std::sqrt(T);
    const double d1 = (std::log(S / K) + (r - q + 0.5 * vol * vol) * T) / vs;
    return {d1, d1 - vs};
}

double price(double S, double K, double r, double q, double T, double vol, bool is_call) {
    check_inputs(S, K, r, q, T, vol);
    if (T <= 0.0) {
        return payoff::intrinsic(is_call, S, K);
    }
    const auto d = d1_d2(S, K, r, q, T, vol);
    const double Sq = S * payoff::discount_factor(q, T);
    const double Kr = K * payoff::discount_factor(r, T);
    if (is_call) {
        return checked(Sq * math::norm_cdf(d.d1) - Kr * math::norm_cdf(d.d2), "price");
    }
    return checked(Kr * math::norm_cdf(-d.d2) - Sq * math::norm_cdf(-d.d1), "price");
}

double price(const OptionSpec& spec) {
    check_european(spec);
    return price(spec.S, spec.K, spec.r, spec.q, spec.T, spec.vol, spec.is_call());
}

PriceGreeks price_greeks(double S, double K, double r, double q, double T, double vol, bool is_call) {
    const double px = price(S, K, r, q, T, vol, is_call);
    if (T <= 0.0) {
        return {px, std::nullopt};
    }

    const auto d = d1_d2(S, K, r, q, T, vol);
    const double sqrtT = std::sqrt(T);
    const double eq = payoff::discount_factor(q, T);
    const double er = payoff::discount_factor(r, T);
    const double nd1 = math::norm_pdf(d.d1);

    Greeks g{};
    // Shared by both sides
    g.gamma = eq * nd1 / (S * vol * sqrtT);
    const double vega = S * eq * sqrtT * nd1;
    const double decay = -(S * vol * eq * nd1) / (2.0 * sqrtT);

    double theta, rho;
    if (is_call) {
        g.delta = eq * math::norm_cdf(d.d1);
        theta = decay - r * K * er * math::norm_cdf(d.d2) + q * S * eq * math::norm_cdf(d.d1);
        rho = K * T * er * math::norm_cdf(d.d2);
    } else {
        g.delta = eq * (math::norm_cdf(d.d1) - 1.0);
        theta = decay + r * K * er * math::norm_cdf(-d.d2) - q * S * eq * math::norm_cdf(-d.d1);
        rho = -K * T * er * math::norm_cdf(-d.d2);
    }

    g.delta = checked(g.delta, "delta");
    g.gamma = checked(g.gamma, "gamma");
    g.theta = checked(theta / 365.0, "theta");
    g.vega = checked(vega / 100.0, "vega");
    g.rho = checked(rho / 100.0, "rho");
    return {px, g};
}

PriceGreeks price_greeks(const OptionSpec& spec) {
    check_european(spec);
    return price_greeks(spec.S, spec.K, spec.r, spec.q, spec.T, spec.vol, spec.is_call());
}

} // namespace roll::bs
