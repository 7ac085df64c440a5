#include "libroll/models/binom.hpp"

#include "libroll/core/payoff.hpp"
#include "libroll/support/trace.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace roll::binom {

namespace {

    // Nudge u by a few ulps until 1/u is its exact reciprocal in floating point.
    double symmetric_up_factor(double u) {
        for (int i = 0; i < 64; ++i) {
            if (u * (1.0 / u) == 1.0) {
                return u;
            }
            u = std::nextafter(u, 2.0 * u);
        }
        throw std::domain_error("binomial: no exactly reciprocal up/down factor near u");
    }

    void check_steps(int steps) {
        if (steps <= 0 || steps > kMaxSteps) {
            ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_LATTICE, static_cast<double>(steps));
            throw std::invalid_argument("binomial: step count must lie in [1, " + std::to_string(kMaxSteps) +
                                        "], got " + std::to_string(steps));
        }
    }

    void check_inputs(double S, double K, double r, double q, double T, double vol, int steps) {
        check_steps(steps);
        if (!std::isfinite(S) || !std::isfinite(K) || !std::isfinite(r) ||
            !std::isfinite(q) || !std::isfinite(T) || !std::isfinite(vol)) {
            ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_LATTICE, 0.0);
            throw std::invalid_argument("binomial: inputs must be finite");
        }
        if (!(S > 0.0) || !(K > 0.0)) {
            ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_LATTICE, S > 0.0 ? K : S);
            throw std::invalid_argument("binomial: spot and strike must be positive");
        }
        // volatility is irrelevant once expired
        if (T > 0.0 && !(vol > 0.0)) {
            ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_LATTICE, vol);
            throw std::domain_error("binomial: volatility must be positive");
        }
    }

    // Asset price at step i with j up-moves.
    inline double node_price(double S0, const CRRParams& c, int i, int j) {
        return S0 * std::pow(c.d, i - j) * std::pow(c.u, j);
    }

    //CRR engine
    LatticeResult price_crr(double S0, double K, double r, double q, double T, double vol,
                            int steps, bool is_call, bool is_american) {
        check_inputs(S0, K, r, q, T, vol, steps);
        if (T <= 0.0) {
            // degenerate: already at expiry
            return {payoff::intrinsic(is_call, S0, K), steps, std::nullopt, -1};
        }
        const auto c = make_crr(r, q, T, vol, steps);
        ROLL_TRACE_LATTICE_START(steps, c.p);

        // terminal layer
        std::vector<double> V(static_cast<std::size_t>(steps) + 1);
        for (int j = 0; j <= steps; ++j) {
            V[j] = payoff::intrinsic(is_call, node_price(S0, c, steps, j), K);
        }

        int earliest_ex_step = -1;

        //backward induction, layer i+1 collapses into layer i
        for (int i = steps - 1; i >= 0; --i) {
            for (int j = 0; j <= i; ++j) {
                const double cont = c.disc * (c.p * V[j + 1] + (1.0 - c.p) * V[j]);
                if (is_american) {
                    const double exer = payoff::intrinsic(is_call, node_price(S0, c, i, j), K);
                    if (exer > cont) {
                        earliest_ex_step = i;
                        V[j] = exer;
                    } else {
                        V[j] = cont;
                    }
                } else {
                    V[j] = cont;
                }
            }
        }

        if (!std::isfinite(V[0])) {
            throw std::domain_error("binomial: lattice value is not finite");
        }
        ROLL_TRACE_LATTICE_COMPLETE(steps, V[0], earliest_ex_step);
        return {V[0], steps, c, earliest_ex_step};
    }

} // namespace

CRRParams make_crr(double r, double q, double T, double vol, int steps) {
    check_steps(steps);
    if (!(T > 0.0) || !(vol > 0.0) || !std::isfinite(T) || !std::isfinite(vol) ||
        !std::isfinite(r) || !std::isfinite(q)) {
        throw std::invalid_argument("binomial: CRR parameters need finite r and q, T > 0 and vol > 0");
    }
    const double dt = T / static_cast<double>(steps);
    const double u  = symmetric_up_factor(std::exp(vol * std::sqrt(dt)));
    const double d  = 1.0 / u;
    const double a  = std::exp((r - q) * dt);
    const double p  = (a - d) / (u - d);
    if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
        ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_LATTICE, p);
        throw std::domain_error("binomial: risk-neutral probability " + std::to_string(p) +
                                " outside [0,1]; increase steps or check r, q, vol");
    }
    const double disc = std::exp(-r * dt);
    return {dt, u, d, p, disc};
}

double price(double S, double K, double r, double q, double T, double vol, int steps, bool is_call, bool is_american){
    return price_crr(S, K, r, q, T, vol, steps, is_call, is_american).price;
}

double price(const OptionSpec& spec, int steps) {
    return price(spec.S, spec.K, spec.r, spec.q, spec.T, spec.vol, steps, spec.is_call(), spec.is_american());
}

LatticeResult price_lattice(double S, double K, double r, double q, double T,
                            double vol, int steps, bool is_call, bool is_american)
{
    return price_crr(S, K, r, q, T, vol, steps, is_call, is_american);
}

LatticeResult price_lattice(const OptionSpec& spec, int steps) {
    return price_lattice(spec.S, spec.K, spec.r, spec.q, spec.T, spec.vol, steps, spec.is_call(), spec.is_american());
}

} // namespace roll::binom
