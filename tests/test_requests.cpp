#include <catch2/catch_all.hpp>

#include "libroll/service/requests.hpp"

#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using roll::service::NodeRequest;
using roll::service::OptionRequest;
using roll::service::TreeRequest;

namespace {

NodeRequest leaf(std::string name, double payoff, std::optional<double> probability = std::nullopt) {
    NodeRequest n;
    n.name = std::move(name);
    n.payoff = payoff;
    n.probability = probability;
    return n;
}

TreeRequest investment_request() {
    NodeRequest invest;
    invest.name = "Invest";
    invest.type = "chance";
    invest.cost = 100000;
    invest.children = {leaf("Success", 300000, 0.7), leaf("Failure", 50000, 0.3)};

    NodeRequest root;
    root.name = "Investment Decision";
    root.children = {invest, leaf("Don't Invest", 0)};

    TreeRequest req;
    req.tree = root;
    return req;
}

} // namespace

TEST_CASE("Black-Scholes request with defaults", "[service][option]") {
    OptionRequest req;
    req.S = 100;
    req.K = 100;

    const auto resp = roll::service::evaluate_option(req);
    REQUIRE(resp.success);
    REQUIRE(resp.error.empty());
    const auto& res = *resp.results;
    REQUIRE(res.model == "black_scholes");
    REQUIRE(res.option_type == "call");
    REQUIRE(res.inputs.r == 0.05);
    REQUIRE(res.inputs.sigma == 0.3);
    REQUIRE(res.inputs.T == 1.0);
    REQUIRE(res.inputs.q == 0.0);
    REQUIRE(res.price == Catch::Approx(14.2313).margin(1e-4));
    REQUIRE(res.greeks.has_value());
    REQUIRE_FALSE(res.u.has_value());
    REQUIRE_FALSE(res.steps.has_value());
    REQUIRE(res.intrinsic == 0.0);
    REQUIRE(res.time_value == Catch::Approx(res.price));
}

TEST_CASE("Binomial request reports lattice parameters", "[service][option]") {
    OptionRequest req;
    req.model = "Binomial";
    req.option_type = "PUT";
    req.S = 90;
    req.K = 100;
    req.american = true;

    const auto resp = roll::service::evaluate_option(req);
    REQUIRE(resp.success);
    const auto& res = *resp.results;
    REQUIRE(res.model == "binomial");
    REQUIRE(res.option_type == "put");
    REQUIRE(res.steps == std::optional<int>(100));
    REQUIRE(res.american == std::optional<bool>(true));
    REQUIRE(res.u.has_value());
    REQUIRE(res.d.has_value());
    REQUIRE(res.p.has_value());
    REQUIRE(*res.u * *res.d == 1.0);
    REQUIRE_FALSE(res.greeks.has_value());
    REQUIRE(res.intrinsic == 10.0);
    REQUIRE(res.price >= res.intrinsic);
    REQUIRE(res.time_value == Catch::Approx(res.price - 10.0));
}

TEST_CASE("Expired black_scholes request reports greeks as not applicable", "[service][option]") {
    OptionRequest req;
    req.S = 110;
    req.K = 100;
    req.T = 0.0;

    const auto resp = roll::service::evaluate_option(req);
    REQUIRE(resp.success);
    REQUIRE(resp.results->price == 10.0);
    REQUIRE_FALSE(resp.results->greeks.has_value());
    REQUIRE(resp.results->time_value == 0.0);
}

TEST_CASE("Option requests fail with a message instead of throwing", "[service][option][errors]") {
    OptionRequest missing;
    missing.S = 100;
    auto resp = roll::service::evaluate_option(missing);
    REQUIRE_FALSE(resp.success);
    REQUIRE_FALSE(resp.results.has_value());
    REQUIRE_THAT(resp.error, Catch::Matchers::ContainsSubstring("'K'"));

    OptionRequest bad_type;
    bad_type.S = 100;
    bad_type.K = 100;
    bad_type.option_type = "straddle";
    REQUIRE_FALSE(roll::service::evaluate_option(bad_type).success);

    OptionRequest bad_model = bad_type;
    bad_model.option_type = "call";
    bad_model.model = "heston";
    REQUIRE_FALSE(roll::service::evaluate_option(bad_model).success);

    OptionRequest american_bs = bad_model;
    american_bs.model = "black_scholes";
    american_bs.american = true;
    REQUIRE_FALSE(roll::service::evaluate_option(american_bs).success);

    OptionRequest zero_vol = bad_model;
    zero_vol.model = "black_scholes";
    zero_vol.sigma = 0.0;
    resp = roll::service::evaluate_option(zero_vol);
    REQUIRE_FALSE(resp.success);
    REQUIRE_THAT(resp.error, Catch::Matchers::ContainsSubstring("volatility"));

    OptionRequest pathological = bad_model;
    pathological.model = "binomial";
    pathological.r = 0.9;
    pathological.sigma = 0.01;
    pathological.n = 2;
    resp = roll::service::evaluate_option(pathological);
    REQUIRE_FALSE(resp.success);
    REQUIRE_THAT(resp.error, Catch::Matchers::ContainsSubstring("outside [0,1]"));
}

TEST_CASE("Non-finite option inputs fail the request", "[service][option][errors]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    for (const char* model : {"black_scholes", "binomial"}) {
        OptionRequest base;
        base.model = model;
        base.S = 100;
        base.K = 100;
        INFO("model=" << model);

        OptionRequest bad_r = base;
        bad_r.r = nan;
        auto resp = roll::service::evaluate_option(bad_r);
        REQUIRE_FALSE(resp.success);
        REQUIRE_FALSE(resp.results.has_value());
        REQUIRE_THAT(resp.error, Catch::Matchers::ContainsSubstring("finite"));

        OptionRequest bad_q = base;
        bad_q.option_type = "put";
        bad_q.q = nan;
        REQUIRE_FALSE(roll::service::evaluate_option(bad_q).success);

        OptionRequest bad_S = base;
        bad_S.S = inf;
        REQUIRE_FALSE(roll::service::evaluate_option(bad_S).success);

        OptionRequest bad_vol = base;
        bad_vol.sigma = inf;
        REQUIRE_FALSE(roll::service::evaluate_option(bad_vol).success);
    }
}

TEST_CASE("Oversized step counts fail the request", "[service][option][errors]") {
    OptionRequest req;
    req.model = "binomial";
    req.S = 100;
    req.K = 100;
    req.n = std::numeric_limits<int>::max();
    const auto resp = roll::service::evaluate_option(req);
    REQUIRE_FALSE(resp.success);
    REQUIRE_THAT(resp.error, Catch::Matchers::ContainsSubstring("step count"));
}

TEST_CASE("Custom defaults apply to absent fields only", "[service][option]") {
    roll::service::OptionDefaults defaults;
    defaults.sigma = 0.2;
    defaults.n = 50;

    OptionRequest req;
    req.model = "binomial";
    req.S = 100;
    req.K = 95;
    req.r = 0.01;

    const auto resp = roll::service::evaluate_option(req, defaults);
    REQUIRE(resp.success);
    REQUIRE(resp.results->inputs.sigma == 0.2);
    REQUIRE(resp.results->inputs.r == 0.01);
    REQUIRE(resp.results->steps == std::optional<int>(50));
}

TEST_CASE("Tree request for the investment example", "[service][tree]") {
    const auto resp = roll::service::evaluate_tree(investment_request());
    REQUIRE(resp.success);
    const auto& a = *resp.results;
    REQUIRE(a.root_emv == Catch::Approx(125000.0));
    REQUIRE(a.optimal_decision == std::optional<std::string>("Invest"));
    REQUIRE(a.decision_path == std::vector<std::string>{"Invest"});
    REQUIRE(a.tree.kind() == roll::tree::NodeKind::Decision);
    REQUIRE(a.tree.child("Don't Invest").kind() == roll::tree::NodeKind::Terminal);
    REQUIRE(a.risk_profiles.size() == 2);
    REQUIRE(a.risk_profiles[0].alternative == "Invest");
}

TEST_CASE("Node types resolve from hints and structure", "[service][tree]") {
    NodeRequest inner;
    inner.name = "inner";
    inner.children = {leaf("a", 1), leaf("b", 2)};  // untyped with children

    NodeRequest odd;
    odd.name = "odd";
    odd.type = "Option";  // unrecognised type
    odd.children = {leaf("c", 3), leaf("d", 4)};

    NodeRequest root;
    root.name = "root";
    root.children = {inner, odd};

    const auto tree = roll::service::build_tree(root);
    REQUIRE(tree.kind() == roll::tree::NodeKind::Decision);
    REQUIRE(tree.child("inner").kind() == roll::tree::NodeKind::Decision);
    REQUIRE(tree.child("odd").kind() == roll::tree::NodeKind::Decision);
    REQUIRE(tree.child("inner").child("a").kind() == roll::tree::NodeKind::Terminal);

    TreeRequest req;
    req.tree = root;
    const auto resp = roll::service::evaluate_tree(req);
    REQUIRE(resp.success);
    REQUIRE(resp.results->root_emv == 4.0);
    REQUIRE(resp.results->decision_path == std::vector<std::string>{"odd", "d"});
}

TEST_CASE("Uniform policy is opt-in on tree requests", "[service][tree]") {
    NodeRequest coin;
    coin.name = "coin";
    coin.type = "chance";
    coin.children = {leaf("heads", 10), leaf("tails", 0)};
    NodeRequest root;
    root.name = "root";
    root.children = {coin, leaf("pass", 4)};

    TreeRequest req;
    req.tree = root;
    const auto strict = roll::service::evaluate_tree(req);
    REQUIRE_FALSE(strict.success);
    REQUIRE_THAT(strict.error, Catch::Matchers::ContainsSubstring("no probability"));

    req.config.policy = roll::tree::ProbabilityPolicy::Uniform;
    const auto uniform = roll::service::evaluate_tree(req);
    REQUIRE(uniform.success);
    REQUIRE(uniform.results->root_emv == Catch::Approx(5.0));
    REQUIRE(uniform.results->optimal_decision == std::optional<std::string>("coin"));
}

TEST_CASE("Malformed tree requests are reported", "[service][tree][errors]") {
    TreeRequest empty;
    auto resp = roll::service::evaluate_tree(empty);
    REQUIRE_FALSE(resp.success);
    REQUIRE_THAT(resp.error, Catch::Matchers::ContainsSubstring("'tree'"));

    NodeRequest no_payoff;
    no_payoff.name = "leaf";
    no_payoff.type = "terminal";
    NodeRequest root;
    root.name = "root";
    root.children = {no_payoff};
    TreeRequest req;
    req.tree = root;
    resp = roll::service::evaluate_tree(req);
    REQUIRE_FALSE(resp.success);
    REQUIRE_THAT(resp.error, Catch::Matchers::ContainsSubstring("no payoff"));

    NodeRequest lonely;
    lonely.name = "lonely";
    lonely.type = "chance";
    root.children = {lonely};
    req.tree = root;
    resp = roll::service::evaluate_tree(req);
    REQUIRE_FALSE(resp.success);
    REQUIRE_THAT(resp.error, Catch::Matchers::ContainsSubstring("no children"));

    NodeRequest busy_terminal = leaf("busy", 1);
    busy_terminal.type = "terminal";
    busy_terminal.children = {leaf("x", 1)};
    root.children = {busy_terminal};
    req.tree = root;
    REQUIRE_FALSE(roll::service::evaluate_tree(req).success);
}
