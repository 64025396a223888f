#include "backends/cpu/up_and_in_call_reflection_cpu.hpp"

#include <algorithm>
#include <cmath>

#include "core/binomial_distribution.hpp"
#include "core/risk_neutral_measure.hpp"
#include "errors.hpp"

std::optional<int> find_barrier_limit(const double up, const int maturity,
                                      const double start_price, const double barrier) {
    const double up_return = 1.0 + up;
    for (int number_ups = 0; number_ups < maturity; ++number_ups) {
        const double level = start_price * std::pow(up_return, number_ups);
        if (std::abs(level - barrier) <= BARRIER_LEVEL_TOLERANCE * std::abs(barrier)) {
            return number_ups;
        }
    }
    return std::nullopt;
}

int barrier_limit(const double up, const int maturity, const double start_price,
                  const double barrier) {
    std::optional<int> limit = find_barrier_limit(up, maturity, start_price, barrier);
    if (!limit) {
        throw BarrierLevelNotFound(barrier, start_price, up, maturity);
    }
    return *limit;
}

double sum_above_barrier(const double rate, const double up, const double down,
                         const int maturity, const double start_price, const double strike,
                         const double barrier, const SummationRange range) {
    const double up_return = 1.0 + up;
    const RiskNeutralMeasure measure = derive_measure(rate, up, down);
    const BinomialDistribution binomial(maturity, measure.probability_up);
    const int limit = barrier_limit(up, maturity, start_price, barrier);

    double sum = 0.0;
    for (int number_ups = 0; number_ups <= last_number_ups(maturity, range); ++number_ups) {
        // Nodes on the barrier are classified by lattice exponent, not by comparing prices.
        const int exponent = 2 * number_ups - maturity;
        const double end_price = start_price * std::pow(up_return, exponent);
        if (exponent >= limit) {
            sum += std::max(end_price - strike, 0.0) * binomial.pmf(number_ups);
        }
    }
    return sum;
}

double sum_below_reflected_barrier(const double rate, const double up, const double down,
                                   const int maturity, const double start_price,
                                   const double strike, const double barrier,
                                   const SummationRange range) {
    const double up_return = 1.0 + up;
    const RiskNeutralMeasure measure = derive_measure(rate, up, down);
    const BinomialDistribution binomial(maturity, measure.probability_up);

    const int limit = barrier_limit(up, maturity, start_price, barrier);
    const double reflected_strike = strike * std::pow(up_return, -2.0 * limit);

    double sum = 0.0;
    for (int number_ups = 0; number_ups <= last_number_ups(maturity, range); ++number_ups) {
        // The reflected barrier start_price^2 / barrier sits at exponent -limit.
        const int exponent = 2 * number_ups - maturity;
        const double end_price = start_price * std::pow(up_return, exponent);
        if (exponent < -limit) {
            sum += std::max(end_price - reflected_strike, 0.0) * binomial.pmf(number_ups);
        }
    }
    const double measure_ratio = measure.probability_up / measure.probability_down;
    return std::pow(measure_ratio, limit) * std::pow(barrier / start_price, 2.0) * sum;
}

double up_and_in_call_reflection_cpu(const double rate, const double up, const double down,
                                     const int maturity, const double start_price,
                                     const double strike, const double barrier,
                                     const SummationRange range) {
    // Resolve the barrier level first so an off-lattice barrier fails before any summation.
    barrier_limit(up, maturity, start_price, barrier);

    const double sum_above =
        sum_above_barrier(rate, up, down, maturity, start_price, strike, barrier, range);
    const double sum_below =
        sum_below_reflected_barrier(rate, up, down, maturity, start_price, strike, barrier, range);
    const double discount = std::pow(1.0 + rate, maturity);

    return (sum_above + sum_below) / discount;
}
