#pragma once
#include "libroll/core/types.hpp"

#include <optional>

namespace roll::binom {

// Largest accepted step count; American rollback is quadratic in steps.
inline constexpr int kMaxSteps = 20000;

// Cox-Ross-Rubinstein per-step parameters. u * d == 1 holds exactly.
struct CRRParams {
    double dt;
    double u, d, p, disc;
};

struct LatticeResult {
    double price;
    int steps;
    std::optional<CRRParams> params; // empty for the T <= 0 intrinsic fallback
    int early_exercise_step;         // earliest step where exercise is optimal, -1 if none
};

CRRParams make_crr(double r, double q, double T, double vol, int steps);

double price(double S, double K, double r, double q, double T, double vol, int steps, bool is_call, bool is_american);

double price(const OptionSpec& spec, int steps);

LatticeResult price_lattice(double S, double K, double r, double q, double T, double vol, int steps, bool is_call, bool is_american);

LatticeResult price_lattice(const OptionSpec& spec, int steps);

} // namespace roll::binom
