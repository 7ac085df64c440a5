#pragma once
#include "libroll/tree/decision_tree.hpp"

#include <vector>

namespace roll::tree {

// Terminal outcomes reachable from `alternative` with their cumulative probability.
// Chance nodes fan out to every child, Decision nodes follow their rolled-back choice.
std::vector<RiskOutcome> risk_profile(const Node& alternative);

double total_probability(const std::vector<RiskOutcome>& outcomes);

double expected_payoff(const std::vector<RiskOutcome>& outcomes);

} // namespace roll::tree
