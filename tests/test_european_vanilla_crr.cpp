#include <catch2/catch.hpp>
#include <cmath>

#include "backends/cpu/european_vanilla_crr_cpu.hpp"
#include "core/binomial_distribution.hpp"
#include "core/risk_neutral_measure.hpp"

TEST_CASE("One-step call skips the all-ups node", "[vanilla][summation_range]") {
    // Only number_ups = 0 is summed: the asset ends at 0.5 and the call pays nothing.
    double call = european_call_crr_cpu(0.0, 1.0, -0.5, 1, 1.0, 1.0);
    double put = european_put_crr_cpu(0.0, 1.0, -0.5, 1, 1.0, 1.0);

    REQUIRE(call == 0.0);
    REQUIRE(put == Approx(binomial_pmf(0, 1, 1.0 / 3.0) * put_payoff(0.5, 1.0)));
    REQUIRE(put == Approx(1.0 / 3.0));

    double call_textbook =
        european_call_crr_cpu(0.0, 1.0, -0.5, 1, 1.0, 1.0, SummationRange::IncludeTerminalNode);
    REQUIRE(call_textbook == Approx(1.0 / 3.0));
}

TEST_CASE("Ten-step call and put reference prices", "[vanilla]") {
    REQUIRE(european_call_crr_cpu(0.05, 1.0, -0.5, 10, 1.0, 1.0) ==
            Approx(0.7482139294033763).epsilon(1e-12));
    REQUIRE(european_put_crr_cpu(0.05, 1.0, -0.5, 10, 1.0, 1.0) ==
            Approx(0.3897137047920062).epsilon(1e-12));
}

TEST_CASE("European Option Put-Call Parity", "[vanilla][put_call_parity]") {
    double S = 100.0;
    double K = 95.0;
    double r = 0.01;
    double u = 0.1;
    double d = -0.05;
    int n = 50;

    double putPrice =
        european_put_crr_cpu(r, u, d, n, S, K, SummationRange::IncludeTerminalNode);
    double callPrice =
        european_call_crr_cpu(r, u, d, n, S, K, SummationRange::IncludeTerminalNode);

    double callPriceParity = putPrice + S - K / std::pow(1.0 + r, n);

    INFO("Put Price: " << putPrice);
    INFO("Call Price: " << callPrice);
    INFO("Call Price from Parity: " << callPriceParity);

    REQUIRE(std::abs(callPrice - callPriceParity) < 1.0e-9);
}

TEST_CASE("Put-call parity gap of the default range is the all-ups node",
          "[vanilla][put_call_parity][summation_range]") {
    double S = 1.0;
    double K = 1.0;
    double r = 0.05;
    double u = 1.0;
    double d = -0.5;
    int n = 10;

    double putPrice = european_put_crr_cpu(r, u, d, n, S, K);
    double callPrice = european_call_crr_cpu(r, u, d, n, S, K);

    // The all-ups node pays only on the call side.
    double p = derive_measure(r, u, d).probability_up;
    double discount = std::pow(1.0 + r, n);
    double terminal_node = std::pow(p, n) * (S * std::pow(1.0 + u, n) - K) / discount;

    REQUIRE(callPrice - putPrice == Approx(S - K / discount - terminal_node).epsilon(1e-12));
}

TEST_CASE("European Option Linear Homogeneity", "[vanilla][linear_hom]") {
    double S = 100.0;
    double K = 150.0;
    double r = 0.01;
    double u = 0.05;
    double d = -0.04;
    int n = 200;
    double alpha = 1.92767;

    double callPrice = european_call_crr_cpu(r, u, d, n, S, K);
    double callPriceS = european_call_crr_cpu(r, u, d, n, alpha * S, alpha * K);

    INFO("Call + Scaling: " << alpha * callPrice);
    INFO("Call with Scaled S,K: " << callPriceS);

    REQUIRE(std::abs(alpha * callPrice - callPriceS) < 1.0e-9);
}

TEST_CASE("Vanilla pricing stays finite for thousands of steps", "[vanilla][large_n]") {
    double S = 100.0;
    double K = 100.0;
    double r = 0.0001;
    double u = 0.01;
    double d = -0.01;
    int n = 2000;

    double callPrice = european_call_crr_cpu(r, u, d, n, S, K, SummationRange::IncludeTerminalNode);
    double putPrice = european_put_crr_cpu(r, u, d, n, S, K, SummationRange::IncludeTerminalNode);

    REQUIRE(std::isfinite(callPrice));
    REQUIRE(std::isfinite(putPrice));
    REQUIRE(callPrice > 0.0);
    REQUIRE(putPrice > 0.0);
    REQUIRE(callPrice - putPrice == Approx(S - K / std::pow(1.0 + r, n)).epsilon(1e-9));
}

TEST_CASE("Custom payoff functions are injected", "[vanilla]") {
    // digital call paying 1 above the strike
    PayoffFunction digital = [](const double asset_price, const double strike) {
        return asset_price > strike ? 1.0 : 0.0;
    };
    double r = 0.0;
    int n = 4;
    double price = european_vanilla_crr_cpu(r, 1.0, -0.5, n, 1.0, 1.0, digital,
                                            SummationRange::IncludeTerminalNode);

    // 2^k * 0.5^(4-k) > 1 only for k = 3, 4
    double p = 1.0 / 3.0;
    double expected = binomial_pmf(3, n, p) + binomial_pmf(4, n, p);
    REQUIRE(price == Approx(expected));
}

TEST_CASE("Degenerate measure at thousands of steps", "[vanilla][large_n]") {
    // rate == down puts all mass on the all-downs scenario
    double callPrice = european_call_crr_cpu(-0.01, 0.01, -0.01, 1100, 100.0, 100.0);
    double putPrice = european_put_crr_cpu(-0.01, 0.01, -0.01, 1100, 100.0, 100.0);

    REQUIRE(callPrice == 0.0);
    REQUIRE(std::isfinite(putPrice));
    REQUIRE(putPrice == Approx((100.0 - 100.0 * std::pow(0.99, 1100)) / std::pow(0.99, 1100)));
}
