#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace roll::tree {

enum class NodeKind { Decision, Chance, Terminal };

// Bounds recursive copy/destruction of Node; rollback itself is iterative.
inline constexpr std::size_t kMaxTreeHeight = 4096;

// How a Chance node treats children that carry no probability.
enum class ProbabilityPolicy {
    Strict,  // missing probability is a validation error
    Uniform  // missing probability becomes 1/n for a Chance node with n children
};

struct RollbackConfig {
    ProbabilityPolicy policy = ProbabilityPolicy::Strict;
    double probability_tolerance = 1e-6;
};

class Node;

// Backward induction over the whole tree. On failure the tree keeps its previous
// derived fields. Returns the root EMV.
double rollback(Node& root, const RollbackConfig& cfg = {});

class Node {
public:
    static Node decision(std::string name, std::vector<Node> children, double cost = 0.0);
    static Node chance(std::string name, std::vector<Node> children, double cost = 0.0);
    static Node terminal(std::string name, double payoff);

    // Probability of this branch under a Chance parent.
    Node with_probability(double p) &&;
    void set_probability(double p);

    const std::string& name() const { return name_; }
    NodeKind kind() const { return kind_; }
    bool is_terminal() const { return kind_ == NodeKind::Terminal; }
    double cost() const { return cost_; }
    const std::optional<double>& probability() const { return probability_; }
    // Throws std::logic_error on non-terminal nodes.
    double payoff() const;
    const std::vector<Node>& children() const { return children_; }
    std::size_t height() const { return height_; }

    // Throws std::out_of_range when no child has that name.
    const Node& child(const std::string& name) const;

    // Derived by rollback().
    bool rolled_back() const { return emv_.has_value(); }
    double emv() const;
    // Name of the chosen child, set only on Decision nodes.
    std::optional<std::string> decision() const;
    const Node* chosen_child() const;
    // Probability actually used for this branch (after the policy filled gaps).
    const std::optional<double>& branch_probability() const { return branch_probability_; }

private:
    Node(std::string name, NodeKind kind, double cost, std::vector<Node> children);

    friend double rollback(Node& root, const RollbackConfig& cfg);

    std::string name_;
    NodeKind kind_;
    double cost_ = 0.0;
    std::optional<double> probability_;
    double payoff_ = 0.0;
    std::vector<Node> children_;
    std::size_t height_ = 1;

    std::optional<double> emv_;
    std::optional<std::size_t> choice_;
    std::optional<double> branch_probability_;
};

const char* to_string(NodeKind kind);

// Decision choices from the root; at Chance nodes the highest-EMV child is followed
// for display only and is not recorded.
std::vector<std::string> optimal_path(const Node& root);

struct RiskOutcome {
    std::string name;
    double probability;
    double payoff;
};

struct AlternativeProfile {
    std::string alternative;
    std::vector<RiskOutcome> outcomes;
};

struct Analysis {
    double root_emv;
    std::optional<std::string> optimal_decision;
    std::vector<std::string> decision_path;
    Node tree;
    // One entry per child of a Decision root, in input order.
    std::vector<AlternativeProfile> risk_profiles;
};

Analysis analyze(Node root, const RollbackConfig& cfg = {});

} // namespace roll::tree
