#include <catch2/catch.hpp>
#include <vector>

#include "core/payoffs.hpp"

TEST_CASE("Call and put payoffs", "[payoff]") {
    REQUIRE(call_payoff(12.0, 10.0) == Approx(2.0));
    REQUIRE(call_payoff(8.0, 10.0) == 0.0);
    REQUIRE(put_payoff(8.0, 10.0) == Approx(2.0));
    REQUIRE(put_payoff(12.0, 10.0) == 0.0);
    REQUIRE(call_payoff(10.0, 10.0) == 0.0);
    REQUIRE(put_payoff(10.0, 10.0) == 0.0);
}

TEST_CASE("Put-call payoff parity", "[payoff]") {
    const double prices[] = {0.5, 1.0, 7.25, 100.0, 1e6};
    const double strikes[] = {0.25, 1.0, 50.0, 99.5};
    for (double S : prices) {
        for (double K : strikes) {
            INFO("S=" << S << " K=" << K);
            REQUIRE(call_payoff(S, K) >= 0.0);
            REQUIRE(put_payoff(S, K) >= 0.0);
            REQUIRE(call_payoff(S, K) - put_payoff(S, K) == Approx(S - K));
        }
    }
}

TEST_CASE("Barrier crossing on a price path", "[payoff][barrier]") {
    REQUIRE(barrier_crossed({1.0, 2.0, 4.0, 2.0}, 4.0));
    REQUIRE(barrier_crossed({8.0}, 4.0));
    REQUIRE_FALSE(barrier_crossed({1.0, 2.0, 1.0, 2.0}, 4.0));
    REQUIRE_FALSE(barrier_crossed({}, 4.0));
}

TEST_CASE("Up-and-in call payoff reads the last price of the path", "[payoff][barrier]") {
    // crossed, ends above strike
    REQUIRE(up_and_in_call_payoff({1.0, 2.0, 4.0, 2.0}, 1.0, 4.0) == Approx(1.0));
    // crossed, ends below strike
    REQUIRE(up_and_in_call_payoff({1.0, 2.0, 4.0, 2.0, 1.0, 0.5}, 1.0, 4.0) == 0.0);
    // never crossed although it ends in the money
    REQUIRE(up_and_in_call_payoff({1.0, 2.0, 1.0, 2.0}, 1.0, 4.0) == 0.0);
    REQUIRE(up_and_in_call_payoff({}, 1.0, 4.0) == 0.0);
}
