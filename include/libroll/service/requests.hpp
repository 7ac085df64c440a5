#pragma once
#include "libroll/models/black_scholes.hpp"
#include "libroll/tree/decision_tree.hpp"

#include <optional>
#include <string>
#include <vector>

namespace roll::service {

// Consumers must check `success` before reading `results`.
template <typename T>
struct Response {
    bool success = false;
    std::optional<T> results;
    std::string error;
};

struct OptionDefaults {
    double r = 0.05;
    double sigma = 0.3;
    double T = 1.0;
    int n = 100;
    double q = 0.0;
    bool american = false;
};

struct OptionRequest {
    std::string option_type = "call";     // call | put
    std::string model = "black_scholes";  // black_scholes | binomial
    std::optional<double> S;
    std::optional<double> K;
    std::optional<double> r;
    std::optional<double> sigma;
    std::optional<double> T;
    std::optional<int> n;
    std::optional<double> q;
    std::optional<bool> american;
};

struct OptionInputs {
    double S, K, r, sigma, T, q;
};

struct OptionResults {
    double price;
    std::string model;
    std::string option_type;
    OptionInputs inputs;
    std::optional<bs::Greeks> greeks; // black_scholes with T > 0 only
    std::optional<int> steps;         // binomial only
    std::optional<bool> american;     // binomial only
    std::optional<double> u, d, p;    // binomial with T > 0 only
    double intrinsic;
    double time_value;
};

Response<OptionResults> evaluate_option(const OptionRequest& request, const OptionDefaults& defaults = {});

// Loose node description; `type` is resolved when the tree is built.
struct NodeRequest {
    std::string name;
    std::optional<std::string> type;
    std::optional<double> cost;
    std::optional<double> probability;
    std::optional<double> payoff;
    std::vector<NodeRequest> children;
};

struct TreeRequest {
    std::optional<NodeRequest> tree;
    tree::RollbackConfig config;
};

// Root defaults to decision; other untyped nodes are terminal when childless and
// decision otherwise. Unrecognised type strings get decision semantics.
// Throws std::invalid_argument on structural errors.
tree::Node build_tree(const NodeRequest& root);

Response<tree::Analysis> evaluate_tree(const TreeRequest& request);

} // namespace roll::service
