#include "libroll/tree/risk_profile.hpp"

#include <stdexcept>
#include <utility>

namespace roll::tree {

std::vector<RiskOutcome> risk_profile(const Node& alternative) {
    if (!alternative.rolled_back()) {
        throw std::logic_error("risk_profile: '" + alternative.name() + "' has not been rolled back");
    }

    std::vector<RiskOutcome> outcomes;
    std::vector<std::pair<const Node*, double>> stack{{&alternative, 1.0}};
    while (!stack.empty()) {
        const auto [node, prob] = stack.back();
        stack.pop_back();

        switch (node->kind()) {
            case NodeKind::Terminal:
                outcomes.push_back({node->name(), prob, node->payoff()});
                break;
            case NodeKind::Chance: {
                const auto& kids = node->children();
                for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
                    stack.emplace_back(&*it, prob * it->branch_probability().value());
                }
                break;
            }
            case NodeKind::Decision: {
                // a rolled-back decision is fixed
                const Node* chosen = node->chosen_child();
                if (chosen == nullptr) {
                    throw std::logic_error("risk_profile: decision '" + node->name() + "' has no choice");
                }
                stack.emplace_back(chosen, prob);
                break;
            }
        }
    }
    return outcomes;
}

double total_probability(const std::vector<RiskOutcome>& outcomes) {
    double total = 0.0;
    for (const auto& o : outcomes) total += o.probability;
    return total;
}

double expected_payoff(const std::vector<RiskOutcome>& outcomes) {
    double ev = 0.0;
    for (const auto& o : outcomes) ev += o.probability * o.payoff;
    return ev;
}

} // namespace roll::tree
