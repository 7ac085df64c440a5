#include <catch2/catch_all.hpp>
#include "libroll/models/black_scholes.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>


TEST_CASE("BS reference call and put, S=K=100 r=5% vol=30% T=1", "[bs]"){
    double S=100,K=100,r=0.05,q=0.0,T=1,vol=0.3;
    double c = roll::bs::price(S,K,r,q,T,vol,true);
    double p = roll::bs::price(S,K,r,q,T,vol,false);
    REQUIRE(c == Catch::Approx(14.2313).margin(1e-4));
    REQUIRE(p == Catch::Approx(9.3542).margin(5e-4));
}


TEST_CASE("BS price symmetry put-call parity", "[bs]"){
double S=100,K=100,r=0.02,q=0.01,T=1,vol=0.2;
double c = roll::bs::price(S,K,r,q,T,vol,true);
double p = roll::bs::price(S,K,r,q,T,vol,false);
double parity = c - p - (S*std::exp(-q*T) - K*std::exp(-r*T));
REQUIRE(std::abs(parity) < 1e-10);
}


TEST_CASE("BS greeks match reference values", "[bs][greeks]"){
    auto call = roll::bs::price_greeks(100, 100, 0.05, 0.0, 1.0, 0.3, true);
    auto put  = roll::bs::price_greeks(100, 100, 0.05, 0.0, 1.0, 0.3, false);
    REQUIRE(call.greeks.has_value());
    REQUIRE(put.greeks.has_value());

    const auto& g = *call.greeks;
    CHECK(g.delta == Catch::Approx(0.624252).margin(1e-6));
    CHECK(g.gamma == Catch::Approx(0.0126478).margin(1e-6));
    CHECK(g.theta == Catch::Approx(-0.0221950).margin(1e-6));  // per day
    CHECK(g.vega  == Catch::Approx(0.379433).margin(1e-6));    // per 1% vol
    CHECK(g.rho   == Catch::Approx(0.481939).margin(1e-6));    // per 1% rate

    const auto& h = *put.greeks;
    CHECK(h.delta == Catch::Approx(-0.375748).margin(1e-6));
    CHECK(h.gamma == Catch::Approx(g.gamma));
    CHECK(h.vega  == Catch::Approx(g.vega));
    CHECK(h.theta == Catch::Approx(-0.00916450).margin(1e-6));
    CHECK(h.rho   == Catch::Approx(-0.469290).margin(1e-6));
}


TEST_CASE("BS greeks vs finite diff", "[bs]"){
    double S=100, K=100, r=0.02, q=0.01, T=1, vol=0.25;

    double h = std::max(1e-4 * S, 1e-6);

    auto g = *roll::bs::price_greeks(S, K, r, q, T, vol, true).greeks;

    // Delta from price (central diff)
    double f_up = roll::bs::price(S+h, K, r, q, T, vol, true);
    double f_dn = roll::bs::price(S-h, K, r, q, T, vol, true);
    double num_delta = (f_up - f_dn) / (2*h);

    // Gamma as derivative of delta (central diff on delta)
    auto g_up = *roll::bs::price_greeks(S+h, K, r, q, T, vol, true).greeks;
    auto g_dn = *roll::bs::price_greeks(S-h, K, r, q, T, vol, true).greeks;
    double num_gamma = (g_up.delta - g_dn.delta) / (2*h);

    // Vega and rho are reported per percentage point
    double hv = 1e-4;
    double num_vega = (roll::bs::price(S, K, r, q, T, vol + hv, true) -
                       roll::bs::price(S, K, r, q, T, vol - hv, true)) / (2*hv) / 100.0;
    double num_rho = (roll::bs::price(S, K, r + hv, q, T, vol, true) -
                      roll::bs::price(S, K, r - hv, q, T, vol, true)) / (2*hv) / 100.0;

    INFO("delta analytic=" << g.delta << " numeric=" << num_delta);
    INFO("gamma analytic=" << g.gamma << " numeric=" << num_gamma);

    REQUIRE(std::abs(g.delta - num_delta) < 1e-5);
    REQUIRE(std::abs(g.gamma - num_gamma) < 1e-4);
    REQUIRE(std::abs(g.vega - num_vega) < 1e-6);
    REQUIRE(std::abs(g.rho - num_rho) < 1e-6);
}

TEST_CASE("BS put theta vs finite diff", "[bs]") {
    double S=100, K=100, r=0.02, q=0.01, T=1.0, vol=0.25;
    bool is_call = false;

    auto g = *roll::bs::price_greeks(S, K, r, q, T, vol, is_call).greeks;

    double hT = 1e-4;
    double p_up = roll::bs::price(S, K, r, q, T + hT, vol, is_call);
    double p_dn = roll::bs::price(S, K, r, q, T - hT, vol, is_call);
    double dV_dT = (p_up - p_dn) / (2.0 * hT);
    double num_theta = -1.0 * dV_dT / 365.0;

    REQUIRE(std::abs(g.theta - num_theta) < 1e-6);
}

TEST_CASE("BS at expiry returns intrinsic and no greeks", "[bs][edge]") {
    REQUIRE(roll::bs::price(110.0, 100.0, 0.05, 0.0, 0.0, 0.3, true) == 10.0);
    REQUIRE(roll::bs::price(90.0, 100.0, 0.05, 0.0, 0.0, 0.3, false) == 10.0);
    REQUIRE(roll::bs::price(90.0, 100.0, 0.05, 0.0, -1.0, 0.3, true) == 0.0);

    const auto pg = roll::bs::price_greeks(110.0, 100.0, 0.05, 0.0, 0.0, 0.3, true);
    REQUIRE(pg.price == 10.0);
    REQUIRE_FALSE(pg.greeks.has_value());
}

TEST_CASE("BS pricing handles deep ITM/OTM and short maturities", "[bs][edge]") {
    const double r = 1e-8;
    const double q = 0.0;
    const double tiny_T = 1e-4;
    const double low_vol = 1e-3;

    const double itm_call = roll::bs::price(100.0, 10.0, r, q, tiny_T, low_vol, true);
    REQUIRE(itm_call == Catch::Approx(90.0).margin(1e-6));

    const double otm_call = roll::bs::price(100.0, 180.0, 0.02, 0.0, 5e-4, 0.6, true);
    REQUIRE(otm_call < 1e-3);

    const auto greeks = *roll::bs::price_greeks(100.0, 90.0, 1e-6, 1e-6, 0.2, 0.35, true).greeks;
    REQUIRE(std::isfinite(greeks.delta));
    REQUIRE(std::isfinite(greeks.gamma));
    REQUIRE(std::isfinite(greeks.vega));
}

TEST_CASE("BS rejects inputs that would divide by zero", "[bs][errors]") {
    REQUIRE_THROWS_AS(roll::bs::price(100, 100, 0.05, 0.0, 1.0, 0.0, true), std::domain_error);
    REQUIRE_THROWS_AS(roll::bs::price(100, 100, 0.05, 0.0, 1.0, -0.2, false), std::domain_error);
    REQUIRE_THROWS_AS(roll::bs::price(0.0, 100, 0.05, 0.0, 1.0, 0.3, true), std::invalid_argument);
    REQUIRE_THROWS_AS(roll::bs::price(100, -5.0, 0.05, 0.0, 1.0, 0.3, true), std::invalid_argument);
    REQUIRE_THROWS_AS(roll::bs::d1_d2(100, 100, 0.05, 0.0, 0.0, 0.3), std::domain_error);

    roll::OptionSpec american{100, 100, 0.05, 0.0, 1.0, 0.3,
                              roll::OptionKind::Put, roll::ExerciseStyle::American};
    REQUIRE_THROWS_AS(roll::bs::price(american), std::invalid_argument);
}

TEST_CASE("BS OptionSpec overload agrees with scalar form", "[bs]") {
    roll::OptionSpec spec{105, 95, 0.03, 0.01, 0.75, 0.22, roll::OptionKind::Put};
    REQUIRE(roll::bs::price(spec) == roll::bs::price(105, 95, 0.03, 0.01, 0.75, 0.22, false));

    const auto d = roll::bs::d1_d2(105, 95, 0.03, 0.01, 0.75, 0.22);
    REQUIRE(d.d1 - d.d2 == Catch::Approx(0.22 * std::sqrt(0.75)));
}

TEST_CASE("BS rejects non-finite inputs", "[bs][errors]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    REQUIRE_THROWS_AS(roll::bs::price(100, 100, nan, 0.0, 1.0, 0.3, true), std::invalid_argument);
    REQUIRE_THROWS_AS(roll::bs::price_greeks(100, 100, 0.05, nan, 1.0, 0.3, false), std::invalid_argument);
    REQUIRE_THROWS_AS(roll::bs::price(inf, 100, 0.05, 0.0, 1.0, 0.3, true), std::invalid_argument);
    REQUIRE_THROWS_AS(roll::bs::price(100, 100, 0.05, 0.0, 1.0, inf, true), std::invalid_argument);
    REQUIRE_THROWS_AS(roll::bs::price(100, 100, 0.05, 0.0, inf, 0.3, false), std::invalid_argument);
    // even an expired option needs finite inputs
    REQUIRE_THROWS_AS(roll::bs::price(100, 100, nan, 0.0, 0.0, 0.3, true), std::invalid_argument);
}

TEST_CASE("BS overflowing price is a domain error", "[bs][errors]") {
    // e^(-rT) overflows to inf for a strongly negative rate
    REQUIRE_THROWS_AS(roll::bs::price(100, 100, -800.0, 0.0, 1.0, 0.3, false), std::domain_error);
}
