#include <catch2/catch.hpp>
#include <cmath>
#include <stdexcept>

#include "core/binomial_distribution.hpp"

TEST_CASE("Binomial PMF small values", "[binomial]") {
    REQUIRE(binomial_pmf(3, 10, 0.3) == Approx(120 * std::pow(0.3, 3) * std::pow(0.7, 7)));
    REQUIRE(binomial_pmf(0, 1, 1.0 / 3.0) == Approx(2.0 / 3.0));
    REQUIRE(binomial_pmf(1, 1, 1.0 / 3.0) == Approx(1.0 / 3.0));
    REQUIRE(binomial_pmf(-1, 10, 0.3) == 0.0);
    REQUIRE(binomial_pmf(11, 10, 0.3) == 0.0);
}

TEST_CASE("Binomial PMF sums to one for large n", "[binomial]") {
    const int n = 2000;
    BinomialDistribution binomial(n, 0.37);
    double total = 0.0;
    double mean = 0.0;
    for (int k = 0; k <= n; ++k) {
        double mass = binomial.pmf(k);
        REQUIRE(std::isfinite(mass));
        total += mass;
        mean += k * mass;
    }
    REQUIRE(total == Approx(1.0).epsilon(1e-10));
    REQUIRE(mean == Approx(n * 0.37).epsilon(1e-10));
}

TEST_CASE("Binomial PMF at the boundary probabilities", "[binomial]") {
    REQUIRE(binomial_pmf(0, 20, 0.0) == Approx(1.0));
    REQUIRE(binomial_pmf(1, 20, 0.0) == 0.0);
    REQUIRE(binomial_pmf(20, 20, 1.0) == Approx(1.0));
    REQUIRE(binomial_pmf(19, 20, 1.0) == 0.0);

    // C(1100, 550) alone overflows a double
    REQUIRE(binomial_pmf(0, 1100, 0.0) == 1.0);
    REQUIRE(binomial_pmf(550, 1100, 0.0) == 0.0);
    REQUIRE(binomial_pmf(550, 1100, 1.0) == 0.0);
    REQUIRE(binomial_pmf(1100, 1100, 1.0) == 1.0);
}

TEST_CASE("Binomial PMF outside [0, 1] is computed, not trapped", "[binomial]") {
    // C(2,1) * 1.5 * (1 - 1.5)
    REQUIRE(binomial_pmf(1, 2, 1.5) == Approx(-1.5));
}

TEST_CASE("Binomial distribution rejects negative trials", "[binomial]") {
    REQUIRE_THROWS_AS(BinomialDistribution(-1, 0.5), std::invalid_argument);
}
