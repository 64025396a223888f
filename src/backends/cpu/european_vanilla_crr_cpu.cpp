#include "backends/cpu/european_vanilla_crr_cpu.hpp"

#include <cmath>

#include "core/binomial_distribution.hpp"
#include "core/risk_neutral_measure.hpp"

double european_vanilla_crr_cpu(const double rate, const double up, const double down,
                                const int maturity, const double start_price, const double strike,
                                const PayoffFunction payoff, const SummationRange range) {
    const double up_return = 1.0 + up;
    const double down_return = 1.0 + down;
    const RiskNeutralMeasure measure = derive_measure(rate, up, down);
    const BinomialDistribution binomial(maturity, measure.probability_up);

    double expected_value = 0.0;
    for (int number_ups = 0; number_ups <= last_number_ups(maturity, range); ++number_ups) {
        const int number_downs = maturity - number_ups;
        const double scenario_return =
            std::pow(up_return, number_ups) * std::pow(down_return, number_downs);
        const double pay = payoff(start_price * scenario_return, strike);
        expected_value += binomial.pmf(number_ups) * pay;
    }
    return expected_value / std::pow(1.0 + rate, maturity);
}
