#include "libroll/service/requests.hpp"

#include "libroll/core/payoff.hpp"
#include "libroll/models/binom.hpp"
#include "libroll/support/trace.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace roll::service {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

tree::NodeKind resolve_kind(const NodeRequest& spec, bool is_root) {
    if (!spec.type) {
        if (is_root) return tree::NodeKind::Decision;
        return spec.children.empty() ? tree::NodeKind::Terminal : tree::NodeKind::Decision;
    }
    const auto t = to_lower(*spec.type);
    if (t == "terminal") return tree::NodeKind::Terminal;
    if (t == "chance") return tree::NodeKind::Chance;
    return tree::NodeKind::Decision;
}

tree::Node build_node(const NodeRequest& spec, std::size_t depth) {
    if (depth > tree::kMaxTreeHeight) {
        throw std::invalid_argument("tree deeper than " + std::to_string(tree::kMaxTreeHeight) + " levels");
    }
    if (spec.name.empty()) {
        throw std::invalid_argument("tree node without a name");
    }

    const auto kind = resolve_kind(spec, depth == 1);
    std::optional<tree::Node> node;
    if (kind == tree::NodeKind::Terminal) {
        if (!spec.children.empty()) {
            throw std::invalid_argument("terminal node '" + spec.name + "' has children");
        }
        if (!spec.payoff) {
            throw std::invalid_argument("terminal node '" + spec.name + "' has no payoff");
        }
        if (spec.cost) {
            throw std::invalid_argument("terminal node '" + spec.name + "' carries a cost; fold it into the payoff");
        }
        node = tree::Node::terminal(spec.name, *spec.payoff);
    } else {
        std::vector<tree::Node> children;
        children.reserve(spec.children.size());
        for (const auto& c : spec.children) {
            children.push_back(build_node(c, depth + 1));
        }
        const double cost = spec.cost.value_or(0.0);
        node = kind == tree::NodeKind::Chance
                   ? tree::Node::chance(spec.name, std::move(children), cost)
                   : tree::Node::decision(spec.name, std::move(children), cost);
    }

    if (spec.probability) {
        node->set_probability(*spec.probability);
    }
    return std::move(*node);
}

} // namespace

Response<OptionResults> evaluate_option(const OptionRequest& request, const OptionDefaults& defaults) {
    Response<OptionResults> response;
    try {
        if (!request.S || !request.K) {
            throw std::invalid_argument("option request requires 'S' (asset value) and 'K' (strike/investment cost)");
        }
        const auto kind = payoff::parse_option_kind(request.option_type);
        const bool is_call = kind == OptionKind::Call;
        const auto model = to_lower(request.model);

        OptionResults res{};
        res.inputs = {*request.S, *request.K,
                      request.r.value_or(defaults.r),
                      request.sigma.value_or(defaults.sigma),
                      request.T.value_or(defaults.T),
                      request.q.value_or(defaults.q)};
        const auto& in = res.inputs;
        res.option_type = payoff::to_string(kind);

        if (model == "binomial") {
            const int n = request.n.value_or(defaults.n);
            const bool american = request.american.value_or(defaults.american);
            const auto lattice = binom::price_lattice(in.S, in.K, in.r, in.q, in.T, in.sigma, n, is_call, american);
            res.price = lattice.price;
            res.model = "binomial";
            res.steps = n;
            res.american = american;
            if (lattice.params) {
                res.u = lattice.params->u;
                res.d = lattice.params->d;
                res.p = lattice.params->p;
            }
        } else if (model == "black_scholes") {
            if (request.american.value_or(false)) {
                throw std::invalid_argument("black_scholes prices European exercise only; use model 'binomial'");
            }
            const auto pg = bs::price_greeks(in.S, in.K, in.r, in.q, in.T, in.sigma, is_call);
            res.price = pg.price;
            res.model = "black_scholes";
            res.greeks = pg.greeks;
        } else {
            throw std::invalid_argument("unknown model '" + request.model + "' (expected black_scholes or binomial)");
        }

        res.intrinsic = payoff::intrinsic(kind, in.S, in.K);
        res.time_value = res.price - res.intrinsic;

        response.success = true;
        response.results = std::move(res);
    } catch (const std::exception& e) {
        response.success = false;
        response.results.reset();
        response.error = e.what();
    }
    ROLL_TRACE_REQUEST(ROLL_MODULE_SERVICE, response.success ? 1 : 0);
    return response;
}

tree::Node build_tree(const NodeRequest& root) {
    return build_node(root, 1);
}

Response<tree::Analysis> evaluate_tree(const TreeRequest& request) {
    Response<tree::Analysis> response;
    try {
        if (!request.tree) {
            throw std::invalid_argument("decision tree request requires a 'tree' specification");
        }
        response.results = tree::analyze(build_tree(*request.tree), request.config);
        response.success = true;
    } catch (const std::exception& e) {
        response.success = false;
        response.results.reset();
        response.error = e.what();
    }
    ROLL_TRACE_REQUEST(ROLL_MODULE_DECISION_TREE, response.success ? 1 : 0);
    return response;
}

} // namespace roll::service
