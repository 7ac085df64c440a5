#include "libroll/check/agreement.hpp"
#include "libroll/models/black_scholes.hpp"
#include "libroll/models/binom.hpp"
#include "libroll/models/real_options.hpp"
#include "libroll/tree/decision_tree.hpp"
#include "libroll/tree/risk_profile.hpp"
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

void print_tree(const roll::tree::Node& node, int depth) {
    std::cout << std::string(2 * depth, ' ') << node.name()
              << " [" << roll::tree::to_string(node.kind()) << "]";
    if (node.branch_probability()) std::cout << " p=" << *node.branch_probability();
    if (node.cost() != 0.0) std::cout << " cost=" << node.cost();
    std::cout << " emv=" << node.emv();
    if (node.decision()) std::cout << " -> " << *node.decision();
    std::cout << "\n";
    for (const auto& c : node.children()) print_tree(c, depth + 1);
}

void run_decision_tree() {
    using roll::tree::Node;
    std::cout << "Example: Investment Decision\n";
    std::cout << "  If invest ($100,000): 70% chance of $300,000, 30% chance of $50,000\n";
    std::cout << "  If don't invest: $0\n\n";

    const auto a = roll::tree::analyze(Node::decision("Investment Decision", {
        Node::chance("Invest", {
            Node::terminal("Success", 300000).with_probability(0.7),
            Node::terminal("Failure", 50000).with_probability(0.3),
        }, 100000),
        Node::terminal("Don't Invest", 0),
    }));

    print_tree(a.tree, 1);
    std::cout << "Optimal Decision: " << a.optimal_decision.value_or("(none)") << "\n";
    std::cout << "Root EMV: " << a.root_emv << "\n";
    for (const auto& alt : a.risk_profiles) {
        std::cout << "Risk profile, " << alt.alternative << ":\n";
        for (const auto& o : alt.outcomes) {
            std::cout << "  " << std::setw(14) << std::left << o.name << std::right
                      << " p=" << o.probability << " payoff=" << o.payoff << "\n";
        }
    }
}

void run_real_options(double S, double K, double r, double q, double T, double vol) {
    const auto delay = roll::real::option_to_delay(S, K, r, vol, T, q);
    std::cout << "NPV if invest now       : " << delay.npv_if_invest_now << "\n";
    std::cout << "Value of option to delay: " << delay.option_value << "\n";
    std::cout << "Value of waiting        : " << delay.value_of_waiting << "\n";
    std::cout << (delay.should_wait() ? "Recommendation: WAIT - option value exceeds NPV\n"
                                      : "Recommendation: INVEST NOW - NPV exceeds option value\n");
    const auto abandon = roll::real::option_to_abandon(S, 0.8 * K, r, vol, T, q);
    std::cout << "Option to abandon at 80% salvage: " << abandon.option_value << "\n";
}

} // namespace

int main(){
    double S, K, r, q, T, vol;
    bool is_call, is_american = false;
    char test, euroamer;
    int type, binom_steps = 100;
    std::string optiontype;

    std::cout << "Input  Valuation\n";
    std::cout << "  1    Black-Scholes\n";
    std::cout << "  2    Binom\n";
    std::cout << "  3    Real options\n";
    std::cout << "  4    Decision tree example\n";
    std::cout << "  5    All\n";
    while(true){
        std::cout << "> ";
        if (std::cin >> type && type >= 1 && type <= 5) break;
        if (std::cin.eof()) return 1;
        std::cout << "Not a type. \n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
    if (type == 4) {
        run_decision_tree();
        return 0;
    }
    if (type == 2 || type == 5){
        while (true) {
        std::cout << "Euro or american? (e/a): ";
        if (std::cin >> euroamer && (euroamer == 'e' || euroamer == 'a')) break;
        if (std::cin.eof()) return 1;
        std::cout << "not an option type.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        }
        is_american = (euroamer == 'a');
        while(true){
            std::cout << "Number of steps: ";
            if (std::cin >> binom_steps && binom_steps > 0) break;
            if (std::cin.eof()) return 1;
            std::cout << "Please input a positive integer.\n";
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        }
    }
    while (true) {
        std::cout << "Input your own specs? y/n ";
        if (std::cin >> test && (test == 'y' || test == 'n')) {
            break;
        }
        if (std::cin.eof()) return 1;
        std::cout << "Please enter 'y' or 'n'.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    if (test == 'y'){
        do{
        std::cout << "call or put?: ";
        if (!(std::cin >> optiontype)) return 1;
        if (optiontype != "call" && optiontype != "put" && optiontype != "Call" && optiontype != "Put") std::cout << "not an option type. \n";
        } while (optiontype != "call" && optiontype != "put" && optiontype != "Call" && optiontype != "Put");
        is_call = (optiontype == "call" || optiontype == "Call");
        std::cout << "Enter current underlying (project) value: ";
        std::cin >> S;
        std::cout << "Enter strike (investment cost): ";
        std::cin >> K;
        std::cout << "Enter current risk-free rate: ";
        std::cin >> r;
        std::cout << "Enter dividend yield (0 if none): ";
        std::cin >> q;
        std::cout << "Enter time to expiration, days: ";
        std::cin >> T;
        T /= 365.0;
        std::cout << "Enter volatility: ";
        std::cin >> vol;
        if (!std::cin) {
            std::cerr << "error: could not read option inputs\n";
            return 1;
        }
    } else {S = 100.0, K = 100.0, r = 0.05, q = 0.0, T = 1, vol = 0.3, is_call = true;}

    try {
        if (type == 1 || type == 5){
            if (type == 5) std::cout << "Black-Scholes: \n";
            const auto bs_results = roll::bs::price_greeks(S,K,r,q,T,vol,is_call);
            std::cout << "Price: " << bs_results.price << "\n";
            if (bs_results.greeks) {
                std::cout << "Delta: " << bs_results.greeks->delta << "\n";
                std::cout << "Gamma: " << bs_results.greeks->gamma << "\n";
                std::cout << "Theta: " << bs_results.greeks->theta << " /day\n";
                std::cout << "Vega : " << bs_results.greeks->vega << " /1% vol\n";
                std::cout << "Rho  : " << bs_results.greeks->rho << " /1% rate\n";
            } else {
                std::cout << "Greeks: n/a at expiry\n";
            }
        }
        if (type == 2 || type == 5){
            if (type == 5) {
                std::cout << "-----------------\n";
                std::cout << "Binomial: \n";
            }
            const auto lattice = roll::binom::price_lattice(S,K,r,q,T,vol,binom_steps,is_call,is_american);
            std::cout << "Price: " << lattice.price << "\n";
            if (lattice.params) {
                std::cout << "u = " << lattice.params->u << ", d = " << lattice.params->d
                          << ", p = " << lattice.params->p << "\n";
            }
            if (lattice.early_exercise_step >= 0) {
                std::cout << "Early exercise optimal from step " << lattice.early_exercise_step << "\n";
            }
            if (!is_american && T > 0.0) {
                const auto agree = roll::check::compare("lattice vs closed form", lattice.price,
                                                        roll::bs::price(S,K,r,q,T,vol,is_call), 0.01);
                std::cout << agree.detail << "\n";
            }
        }
        if (type == 3 || type == 5){
            if (type == 5) {
                std::cout << "-----------------\n";
                std::cout << "Real options: \n";
            }
            run_real_options(S, K, r, q, T, vol);
        }
        if (type == 5){
            std::cout << "-----------------\n";
            run_decision_tree();
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
