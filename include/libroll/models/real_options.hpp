#pragma once

namespace roll::real {

// Option to defer an investment: a call on the project value V struck at the cost I.
struct DelayValue {
    double option_value;
    double npv_if_invest_now;
    double value_of_waiting;

    bool should_wait() const { return value_of_waiting > 0.0; }
};

struct ExpandValue {
    double option_value;
    double additional_capacity_value;
    double expansion_cost;
};

struct AbandonValue {
    double option_value;
    double salvage_value;
    double current_project_value;
};

DelayValue option_to_delay(double V, double I, double r, double sigma, double T, double q = 0.0);

// Call on V * (expansion_factor - 1), e.g. factor 1.5 adds half the current capacity.
ExpandValue option_to_expand(double V, double expansion_cost, double expansion_factor,
                             double r, double sigma, double T, double q = 0.0);

AbandonValue option_to_abandon(double V, double salvage_value, double r, double sigma, double T, double q = 0.0);

} // namespace roll::real
