#include "libroll/tree/decision_tree.hpp"
#include "libroll/tree/risk_profile.hpp"

#include "libroll/support/trace.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace roll::tree {

namespace {

struct Scratch {
    double emv = 0.0;
    std::optional<std::size_t> choice;
    std::optional<double> branch_probability;
};

std::string describe(const Node& node) {
    return std::string(to_string(node.kind())) + " node '" + node.name() + "'";
}

void roll_chance(const Node& node, std::unordered_map<const Node*, Scratch>& scratch,
                 const RollbackConfig& cfg) {
    const auto& kids = node.children();
    const double uniform = 1.0 / static_cast<double>(kids.size());
    double total = 0.0;
    double expected = 0.0;
    for (const auto& c : kids) {
        double p;
        if (c.probability()) {
            p = *c.probability();
        } else if (cfg.policy == ProbabilityPolicy::Uniform) {
            p = uniform;
        } else {
            ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_DECISION_TREE, 0.0);
            throw std::invalid_argument(describe(node) + ": child '" + c.name() + "' has no probability");
        }
        auto& s = scratch[&c];
        s.branch_probability = p;
        total += p;
        expected += p * s.emv;
    }
    if (std::abs(total - 1.0) > cfg.probability_tolerance) {
        ROLL_TRACE_VALIDATION_ERROR(ROLL_MODULE_DECISION_TREE, total);
        std::ostringstream msg;
        msg << describe(node) << ": child probabilities sum to " << total << ", expected 1";
        throw std::invalid_argument(msg.str());
    }
    scratch[&node].emv = expected - node.cost();
}

// Ties keep the first child in input order.
void roll_decision(const Node& node, std::unordered_map<const Node*, Scratch>& scratch) {
    const auto& kids = node.children();
    std::size_t best = 0;
    double best_emv = scratch[&kids[0]].emv;
    for (std::size_t i = 1; i < kids.size(); ++i) {
        const double v = scratch[&kids[i]].emv;
        if (v > best_emv) {
            best = i;
            best_emv = v;
        }
    }
    auto& s = scratch[&node];
    s.emv = best_emv - node.cost();
    s.choice = best;
}

const Node& best_chance_child(const Node& node) {
    const auto& kids = node.children();
    const Node* best = &kids[0];
    for (const auto& c : kids) {
        if (c.emv() > best->emv()) best = &c;
    }
    return *best;
}

} // namespace

Node::Node(std::string name, NodeKind kind, double cost, std::vector<Node> children)
    : name_(std::move(name)), kind_(kind), cost_(cost), children_(std::move(children)) {
    if (!std::isfinite(cost_)) {
        throw std::invalid_argument(describe(*this) + ": cost must be finite");
    }
    if (kind_ == NodeKind::Terminal) {
        return;
    }
    if (children_.empty()) {
        throw std::invalid_argument(describe(*this) + " has no children");
    }
    std::unordered_set<std::string> seen;
    std::size_t tallest = 0;
    for (const auto& c : children_) {
        if (!seen.insert(c.name()).second) {
            throw std::invalid_argument(describe(*this) + ": duplicate child name '" + c.name() + "'");
        }
        tallest = std::max(tallest, c.height());
    }
    height_ = tallest + 1;
    if (height_ > kMaxTreeHeight) {
        throw std::invalid_argument(describe(*this) + ": tree height exceeds " + std::to_string(kMaxTreeHeight));
    }
}

Node Node::decision(std::string name, std::vector<Node> children, double cost) {
    return Node(std::move(name), NodeKind::Decision, cost, std::move(children));
}

Node Node::chance(std::string name, std::vector<Node> children, double cost) {
    return Node(std::move(name), NodeKind::Chance, cost, std::move(children));
}

Node Node::terminal(std::string name, double payoff) {
    Node n(std::move(name), NodeKind::Terminal, 0.0, {});
    if (!std::isfinite(payoff)) {
        throw std::invalid_argument(describe(n) + ": payoff must be finite");
    }
    n.payoff_ = payoff;
    return n;
}

Node Node::with_probability(double p) && {
    set_probability(p);
    return std::move(*this);
}

void Node::set_probability(double p) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument(describe(*this) + ": probability must lie in [0,1]");
    }
    probability_ = p;
}

double Node::payoff() const {
    if (kind_ != NodeKind::Terminal) {
        throw std::logic_error(describe(*this) + " carries no payoff");
    }
    return payoff_;
}

const Node& Node::child(const std::string& name) const {
    for (const auto& c : children_) {
        if (c.name() == name) return c;
    }
    throw std::out_of_range(describe(*this) + " has no child '" + name + "'");
}

double Node::emv() const {
    if (!emv_) {
        throw std::logic_error(describe(*this) + " has not been rolled back");
    }
    return *emv_;
}

std::optional<std::string> Node::decision() const {
    if (!choice_) return std::nullopt;
    return children_[*choice_].name();
}

const Node* Node::chosen_child() const {
    return choice_ ? &children_[*choice_] : nullptr;
}

const char* to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::Decision: return "decision";
        case NodeKind::Chance:   return "chance";
        case NodeKind::Terminal: return "terminal";
    }
    return "unknown";
}

double rollback(Node& root, const RollbackConfig& cfg) {
    // post-order with an explicit stack: children before parent, siblings in input order
    struct Frame {
        Node* node;
        bool expanded;
    };
    std::vector<Node*> order;
    std::vector<Frame> stack{{&root, false}};
    while (!stack.empty()) {
        const Frame f = stack.back();
        stack.pop_back();
        auto& kids = f.node->children_;
        if (f.expanded || kids.empty()) {
            order.push_back(f.node);
            continue;
        }
        stack.push_back({f.node, true});
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            stack.push_back({&*it, false});
        }
    }
    ROLL_TRACE_ROLLBACK_START(order.size());

    std::unordered_map<const Node*, Scratch> scratch;
    scratch.reserve(order.size());
    for (const Node* n : order) {
        switch (n->kind()) {
            case NodeKind::Terminal:
                scratch[n].emv = n->payoff();
                break;
            case NodeKind::Chance:
                roll_chance(*n, scratch, cfg);
                break;
            case NodeKind::Decision:
                roll_decision(*n, scratch);
                break;
        }
    }

    // commit only once every node evaluated
    for (Node* n : order) {
        auto& s = scratch[n];
        n->emv_ = s.emv;
        n->choice_ = s.choice;
        n->branch_probability_ = s.branch_probability;
    }

    ROLL_TRACE_ROLLBACK_COMPLETE(order.size(), *root.emv_);
    return *root.emv_;
}

std::vector<std::string> optimal_path(const Node& root) {
    std::vector<std::string> path;
    const Node* n = &root;
    while (!n->is_terminal()) {
        if (n->kind() == NodeKind::Decision) {
            const Node* c = n->chosen_child();
            if (c == nullptr) {
                throw std::logic_error(describe(*n) + " has not been rolled back");
            }
            path.push_back(c->name());
            n = c;
        } else {
            n = &best_chance_child(*n);
        }
    }
    return path;
}

Analysis analyze(Node root, const RollbackConfig& cfg) {
    const double root_emv = rollback(root, cfg);
    auto path = optimal_path(root);

    std::vector<AlternativeProfile> profiles;
    if (root.kind() == NodeKind::Decision) {
        profiles.reserve(root.children().size());
        for (const auto& alt : root.children()) {
            profiles.push_back({alt.name(), risk_profile(alt)});
        }
    }

    std::optional<std::string> first;
    if (!path.empty()) first = path.front();
    return {root_emv, std::move(first), std::move(path), std::move(root), std::move(profiles)};
}

} // namespace roll::tree
