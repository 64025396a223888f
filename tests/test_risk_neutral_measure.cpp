#include <catch2/catch.hpp>

#include "core/risk_neutral_measure.hpp"

TEST_CASE("Risk-neutral measure of the doubling/halving lattice", "[measure]") {
    RiskNeutralMeasure measure = derive_measure(0.0, 1.0, -0.5);

    REQUIRE(measure.probability_up == Approx(1.0 / 3.0));
    REQUIRE(measure.probability_down == Approx(2.0 / 3.0));
}

TEST_CASE("Risk-neutral probabilities sum to one inside (0, 1)", "[measure]") {
    const double rates[] = {-0.25, 0.0, 0.01, 0.05, 0.25, 0.99};
    for (double rate : rates) {
        RiskNeutralMeasure measure = derive_measure(MarketModel(rate, 1.0, -0.5));

        INFO("rate: " << rate);
        REQUIRE(measure.probability_up + measure.probability_down == Approx(1.0));
        REQUIRE(measure.probability_up > 0.0);
        REQUIRE(measure.probability_up < 1.0);
        REQUIRE(measure.probability_down > 0.0);
        REQUIRE(measure.probability_down < 1.0);
    }
}

TEST_CASE("Arbitrage inputs are not rejected by the measure", "[measure]") {
    // rate above up: the formula still evaluates, outside [0, 1]
    RiskNeutralMeasure measure = derive_measure(0.5, 0.2, -0.1);

    REQUIRE(measure.probability_up == Approx(2.0));
    REQUIRE(measure.probability_down == Approx(-1.0));
}
