#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "libroll/check/agreement.hpp"
#include "libroll/core/payoff.hpp"
#include "libroll/core/types.hpp"
#include "libroll/models/binom.hpp"
#include "libroll/models/black_scholes.hpp"
#include "libroll/models/real_options.hpp"
#include "libroll/service/requests.hpp"
#include "libroll/tree/decision_tree.hpp"
#include "libroll/tree/risk_profile.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

PYBIND11_MODULE(rollpy, m) {
    m.doc() = "Decision-tree rollback and option valuation";

    // --- Option description ---
    py::enum_<roll::OptionKind>(m, "OptionKind")
        .value("Call", roll::OptionKind::Call)
        .value("Put", roll::OptionKind::Put);

    py::enum_<roll::ExerciseStyle>(m, "ExerciseStyle")
        .value("European", roll::ExerciseStyle::European)
        .value("American", roll::ExerciseStyle::American);

    py::class_<roll::OptionSpec>(m, "OptionSpec")
        .def(py::init([](double S, double K, double r, double q, double T, double vol,
                         roll::OptionKind kind, roll::ExerciseStyle style) {
                 return roll::OptionSpec{S, K, r, q, T, vol, kind, style};
             }),
            py::arg("S"), py::arg("K"), py::arg("r"), py::arg("q"),
            py::arg("T"), py::arg("vol"),
            py::arg("kind") = roll::OptionKind::Call,
            py::arg("style") = roll::ExerciseStyle::European)
        .def_readwrite("S", &roll::OptionSpec::S)
        .def_readwrite("K", &roll::OptionSpec::K)
        .def_readwrite("r", &roll::OptionSpec::r)
        .def_readwrite("q", &roll::OptionSpec::q)
        .def_readwrite("T", &roll::OptionSpec::T)
        .def_readwrite("vol", &roll::OptionSpec::vol)
        .def_readwrite("kind", &roll::OptionSpec::kind)
        .def_readwrite("style", &roll::OptionSpec::style);

    m.def("intrinsic",
        py::overload_cast<roll::OptionKind, double, double>(&roll::payoff::intrinsic),
        "Exercise value max(S-K,0) or max(K-S,0)",
        py::arg("kind"), py::arg("S"), py::arg("K"));

    // --- Black-Scholes types ---
    py::class_<roll::bs::Greeks>(m, "Greeks")
        .def_readonly("delta", &roll::bs::Greeks::delta)
        .def_readonly("gamma", &roll::bs::Greeks::gamma)
        .def_readonly("theta", &roll::bs::Greeks::theta)
        .def_readonly("vega",  &roll::bs::Greeks::vega)
        .def_readonly("rho",   &roll::bs::Greeks::rho);

    py::class_<roll::bs::PriceGreeks>(m, "PriceGreeks")
        .def_readonly("price",  &roll::bs::PriceGreeks::price)
        .def_readonly("greeks", &roll::bs::PriceGreeks::greeks);

    // --- Binomial types ---
    py::class_<roll::binom::CRRParams>(m, "CRRParams")
        .def_readonly("dt",   &roll::binom::CRRParams::dt)
        .def_readonly("u",    &roll::binom::CRRParams::u)
        .def_readonly("d",    &roll::binom::CRRParams::d)
        .def_readonly("p",    &roll::binom::CRRParams::p)
        .def_readonly("disc", &roll::binom::CRRParams::disc);

    py::class_<roll::binom::LatticeResult>(m, "LatticeResult")
        .def_readonly("price",               &roll::binom::LatticeResult::price)
        .def_readonly("steps",               &roll::binom::LatticeResult::steps)
        .def_readonly("params",              &roll::binom::LatticeResult::params)
        .def_readonly("early_exercise_step", &roll::binom::LatticeResult::early_exercise_step);

    // --- Black-Scholes functions ---
    m.def("bs_price",
        py::overload_cast<double, double, double, double, double, double, bool>(&roll::bs::price),
        "Black-Scholes price",
        py::arg("S"), py::arg("K"), py::arg("r"), py::arg("q"),
        py::arg("T"), py::arg("vol"), py::arg("is_call"));

    m.def("bs_price_greeks",
        py::overload_cast<double, double, double, double, double, double, bool>(&roll::bs::price_greeks),
        "BS price + Greeks (None at expiry)",
        py::arg("S"), py::arg("K"), py::arg("r"), py::arg("q"),
        py::arg("T"), py::arg("vol"), py::arg("is_call"));

    m.def("bs_price_spec",
        py::overload_cast<const roll::OptionSpec&>(&roll::bs::price),
        "Black-Scholes price of a European OptionSpec",
        py::arg("spec"));

    // --- Binomial functions ---
    m.def("make_crr",
        &roll::binom::make_crr,
        "CRR lattice parameters",
        py::arg("r"), py::arg("q"), py::arg("T"), py::arg("vol"), py::arg("steps"));

    m.def("binom_price",
        py::overload_cast<double, double, double, double, double, double, int, bool, bool>(&roll::binom::price),
        "CRR binomial price",
        py::arg("S"), py::arg("K"), py::arg("r"), py::arg("q"),
        py::arg("T"), py::arg("vol"), py::arg("steps"),
        py::arg("is_call"), py::arg("is_american"));

    m.def("binom_price_lattice",
        py::overload_cast<double, double, double, double, double, double, int, bool, bool>(&roll::binom::price_lattice),
        "CRR binomial price + lattice parameters + earliest early-exercise step",
        py::arg("S"), py::arg("K"), py::arg("r"), py::arg("q"),
        py::arg("T"), py::arg("vol"), py::arg("steps"),
        py::arg("is_call"), py::arg("is_american"));

    // --- Real options ---
    py::class_<roll::real::DelayValue>(m, "DelayValue")
        .def_readonly("option_value",      &roll::real::DelayValue::option_value)
        .def_readonly("npv_if_invest_now", &roll::real::DelayValue::npv_if_invest_now)
        .def_readonly("value_of_waiting",  &roll::real::DelayValue::value_of_waiting)
        .def("should_wait", &roll::real::DelayValue::should_wait);

    py::class_<roll::real::ExpandValue>(m, "ExpandValue")
        .def_readonly("option_value",              &roll::real::ExpandValue::option_value)
        .def_readonly("additional_capacity_value", &roll::real::ExpandValue::additional_capacity_value)
        .def_readonly("expansion_cost",            &roll::real::ExpandValue::expansion_cost);

    py::class_<roll::real::AbandonValue>(m, "AbandonValue")
        .def_readonly("option_value",          &roll::real::AbandonValue::option_value)
        .def_readonly("salvage_value",         &roll::real::AbandonValue::salvage_value)
        .def_readonly("current_project_value", &roll::real::AbandonValue::current_project_value);

    m.def("option_to_delay", &roll::real::option_to_delay,
        py::arg("V"), py::arg("I"), py::arg("r"), py::arg("sigma"), py::arg("T"), py::arg("q") = 0.0);

    m.def("option_to_expand", &roll::real::option_to_expand,
        py::arg("V"), py::arg("expansion_cost"), py::arg("expansion_factor"),
        py::arg("r"), py::arg("sigma"), py::arg("T"), py::arg("q") = 0.0);

    m.def("option_to_abandon", &roll::real::option_to_abandon,
        py::arg("V"), py::arg("salvage_value"), py::arg("r"), py::arg("sigma"), py::arg("T"), py::arg("q") = 0.0);

    // --- Decision trees ---
    py::enum_<roll::tree::NodeKind>(m, "NodeKind")
        .value("Decision", roll::tree::NodeKind::Decision)
        .value("Chance", roll::tree::NodeKind::Chance)
        .value("Terminal", roll::tree::NodeKind::Terminal);

    py::enum_<roll::tree::ProbabilityPolicy>(m, "ProbabilityPolicy")
        .value("Strict", roll::tree::ProbabilityPolicy::Strict)
        .value("Uniform", roll::tree::ProbabilityPolicy::Uniform);

    py::class_<roll::tree::RollbackConfig>(m, "RollbackConfig")
        .def(py::init<>())
        .def_readwrite("policy", &roll::tree::RollbackConfig::policy)
        .def_readwrite("probability_tolerance", &roll::tree::RollbackConfig::probability_tolerance);

    py::class_<roll::tree::Node>(m, "Node")
        .def_static("decision", &roll::tree::Node::decision,
            py::arg("name"), py::arg("children"), py::arg("cost") = 0.0)
        .def_static("chance", &roll::tree::Node::chance,
            py::arg("name"), py::arg("children"), py::arg("cost") = 0.0)
        .def_static("terminal", &roll::tree::Node::terminal,
            py::arg("name"), py::arg("payoff"))
        .def("with_probability", [](roll::tree::Node n, double p) {
                return std::move(n).with_probability(p);
            }, py::arg("p"))
        .def_property_readonly("name", &roll::tree::Node::name)
        .def_property_readonly("kind", &roll::tree::Node::kind)
        .def_property_readonly("cost", &roll::tree::Node::cost)
        .def_property_readonly("probability", &roll::tree::Node::probability)
        .def_property_readonly("payoff", &roll::tree::Node::payoff)
        .def_property_readonly("children", &roll::tree::Node::children)
        .def_property_readonly("rolled_back", &roll::tree::Node::rolled_back)
        .def_property_readonly("emv", &roll::tree::Node::emv)
        .def_property_readonly("decision", &roll::tree::Node::decision)
        .def_property_readonly("branch_probability", &roll::tree::Node::branch_probability)
        .def("child", &roll::tree::Node::child, py::arg("name"), py::return_value_policy::copy)
        .def("__repr__", [](const roll::tree::Node& n) {
            return "Node{" + n.name() + ", " + roll::tree::to_string(n.kind()) + "}";
        });

    py::class_<roll::tree::RiskOutcome>(m, "RiskOutcome")
        .def_readonly("name",        &roll::tree::RiskOutcome::name)
        .def_readonly("probability", &roll::tree::RiskOutcome::probability)
        .def_readonly("payoff",      &roll::tree::RiskOutcome::payoff);

    py::class_<roll::tree::AlternativeProfile>(m, "AlternativeProfile")
        .def_readonly("alternative", &roll::tree::AlternativeProfile::alternative)
        .def_readonly("outcomes",    &roll::tree::AlternativeProfile::outcomes);

    py::class_<roll::tree::Analysis>(m, "Analysis")
        .def_readonly("root_emv",         &roll::tree::Analysis::root_emv)
        .def_readonly("optimal_decision", &roll::tree::Analysis::optimal_decision)
        .def_readonly("decision_path",    &roll::tree::Analysis::decision_path)
        .def_readonly("tree",             &roll::tree::Analysis::tree)
        .def_readonly("risk_profiles",    &roll::tree::Analysis::risk_profiles);

    m.def("rollback", &roll::tree::rollback,
        "Backward induction in place; returns the root EMV",
        py::arg("root"), py::arg("cfg") = roll::tree::RollbackConfig{});

    m.def("optimal_path", &roll::tree::optimal_path, py::arg("root"));

    m.def("risk_profile", &roll::tree::risk_profile, py::arg("alternative"));

    m.def("analyze", &roll::tree::analyze,
        "Roll back a copy of the tree and collect path and risk profiles",
        py::arg("root"), py::arg("cfg") = roll::tree::RollbackConfig{});

    // --- Agreement checks ---
    py::class_<roll::check::Check>(m, "Check")
        .def_readonly("label",         &roll::check::Check::label)
        .def_readonly("passed",        &roll::check::Check::passed)
        .def_readonly("forge",         &roll::check::Check::forge)
        .def_readonly("reference",     &roll::check::Check::reference)
        .def_readonly("relative_diff", &roll::check::Check::relative_diff)
        .def_readonly("detail",        &roll::check::Check::detail);

    m.def("relative_difference", &roll::check::relative_difference,
        py::arg("actual"), py::arg("expected"));

    m.def("compare", &roll::check::compare,
        py::arg("label"), py::arg("forge"), py::arg("reference"), py::arg("tolerance"));

    // --- Request layer ---
    py::class_<roll::service::OptionDefaults>(m, "OptionDefaults")
        .def(py::init<>())
        .def_readwrite("r",        &roll::service::OptionDefaults::r)
        .def_readwrite("sigma",    &roll::service::OptionDefaults::sigma)
        .def_readwrite("T",        &roll::service::OptionDefaults::T)
        .def_readwrite("n",        &roll::service::OptionDefaults::n)
        .def_readwrite("q",        &roll::service::OptionDefaults::q)
        .def_readwrite("american", &roll::service::OptionDefaults::american);

    py::class_<roll::service::OptionRequest>(m, "OptionRequest")
        .def(py::init<>())
        .def_readwrite("option_type", &roll::service::OptionRequest::option_type)
        .def_readwrite("model",       &roll::service::OptionRequest::model)
        .def_readwrite("S",           &roll::service::OptionRequest::S)
        .def_readwrite("K",           &roll::service::OptionRequest::K)
        .def_readwrite("r",           &roll::service::OptionRequest::r)
        .def_readwrite("sigma",       &roll::service::OptionRequest::sigma)
        .def_readwrite("T",           &roll::service::OptionRequest::T)
        .def_readwrite("n",           &roll::service::OptionRequest::n)
        .def_readwrite("q",           &roll::service::OptionRequest::q)
        .def_readwrite("american",    &roll::service::OptionRequest::american);

    py::class_<roll::service::OptionInputs>(m, "OptionInputs")
        .def_readonly("S",     &roll::service::OptionInputs::S)
        .def_readonly("K",     &roll::service::OptionInputs::K)
        .def_readonly("r",     &roll::service::OptionInputs::r)
        .def_readonly("sigma", &roll::service::OptionInputs::sigma)
        .def_readonly("T",     &roll::service::OptionInputs::T)
        .def_readonly("q",     &roll::service::OptionInputs::q);

    py::class_<roll::service::OptionResults>(m, "OptionResults")
        .def_readonly("price",       &roll::service::OptionResults::price)
        .def_readonly("model",       &roll::service::OptionResults::model)
        .def_readonly("option_type", &roll::service::OptionResults::option_type)
        .def_readonly("inputs",      &roll::service::OptionResults::inputs)
        .def_readonly("greeks",      &roll::service::OptionResults::greeks)
        .def_readonly("steps",       &roll::service::OptionResults::steps)
        .def_readonly("american",    &roll::service::OptionResults::american)
        .def_readonly("u",           &roll::service::OptionResults::u)
        .def_readonly("d",           &roll::service::OptionResults::d)
        .def_readonly("p",           &roll::service::OptionResults::p)
        .def_readonly("intrinsic",   &roll::service::OptionResults::intrinsic)
        .def_readonly("time_value",  &roll::service::OptionResults::time_value);

    using OptionResponse = roll::service::Response<roll::service::OptionResults>;
    py::class_<OptionResponse>(m, "OptionResponse")
        .def_readonly("success", &OptionResponse::success)
        .def_readonly("results", &OptionResponse::results)
        .def_readonly("error",   &OptionResponse::error);

    py::class_<roll::service::NodeRequest>(m, "NodeRequest")
        .def(py::init<>())
        .def_readwrite("name",        &roll::service::NodeRequest::name)
        .def_readwrite("type",        &roll::service::NodeRequest::type)
        .def_readwrite("cost",        &roll::service::NodeRequest::cost)
        .def_readwrite("probability", &roll::service::NodeRequest::probability)
        .def_readwrite("payoff",      &roll::service::NodeRequest::payoff)
        .def_readwrite("children",    &roll::service::NodeRequest::children);

    py::class_<roll::service::TreeRequest>(m, "TreeRequest")
        .def(py::init<>())
        .def_readwrite("tree",   &roll::service::TreeRequest::tree)
        .def_readwrite("config", &roll::service::TreeRequest::config);

    using TreeResponse = roll::service::Response<roll::tree::Analysis>;
    py::class_<TreeResponse>(m, "TreeResponse")
        .def_readonly("success", &TreeResponse::success)
        .def_readonly("results", &TreeResponse::results)
        .def_readonly("error",   &TreeResponse::error);

    m.def("evaluate_option", &roll::service::evaluate_option,
        "Price an option request; failures are reported in the response",
        py::arg("request"), py::arg("defaults") = roll::service::OptionDefaults{});

    m.def("build_tree", &roll::service::build_tree, py::arg("root"));

    m.def("evaluate_tree", &roll::service::evaluate_tree,
        "Analyse a tree request; failures are reported in the response",
        py::arg("request"));

    using DenseArray = py::array_t<double, py::array::c_style | py::array::forcecast>;
    m.def("bs_price_vectorized",
        [](DenseArray S, DenseArray K, double r, double q, double T, DenseArray vol, bool is_call) {
            auto buf_S = S.request();
            auto buf_K = K.request();
            auto buf_vol = vol.request();

            if (buf_S.ndim != 1 || buf_K.ndim != 1 || buf_vol.ndim != 1) {
                throw std::invalid_argument("Inputs must be one-dimensional");
            }
            if (buf_S.size != buf_K.size || buf_S.size != buf_vol.size) {
                throw std::invalid_argument("Input shapes must match");
            }

            auto result = py::array_t<double>(buf_S.size);
            auto buf_res = result.request();

            const double* ptr_S = static_cast<const double*>(buf_S.ptr);
            const double* ptr_K = static_cast<const double*>(buf_K.ptr);
            const double* ptr_vol = static_cast<const double*>(buf_vol.ptr);
            double* ptr_res = static_cast<double*>(buf_res.ptr);

            py::gil_scoped_release release;

            for (py::ssize_t i = 0; i < buf_S.size; ++i) {
                ptr_res[i] = roll::bs::price(ptr_S[i], ptr_K[i], r, q, T, ptr_vol[i], is_call);
            }

            return result;
        },
        "Vectorized Black-Scholes pricer over 1-D numpy arrays (copied to contiguous doubles)"
    );
}
