#pragma once

#include "constants.hpp"
#include "core/payoffs.hpp"

/**
 * @brief Prices a European claim with a terminal payoff in the CRR binomial model.
 *
 * @param payoff  Terminal payoff, e.g. call_payoff or put_payoff.
 * @param range   Scenarios visited by the sum.
 * @return The discounted risk-neutral expectation of the payoff.
 */
double european_vanilla_crr_cpu(const double rate, const double up, const double down,
                                const int maturity, const double start_price, const double strike,
                                const PayoffFunction payoff,
                                const SummationRange range = DEFAULT_SUMMATION_RANGE);

inline double european_call_crr_cpu(const double rate, const double up, const double down,
                                    const int maturity, const double start_price,
                                    const double strike,
                                    const SummationRange range = DEFAULT_SUMMATION_RANGE) {
    return european_vanilla_crr_cpu(rate, up, down, maturity, start_price, strike, call_payoff,
                                    range);
}

inline double european_put_crr_cpu(const double rate, const double up, const double down,
                                   const int maturity, const double start_price,
                                   const double strike,
                                   const SummationRange range = DEFAULT_SUMMATION_RANGE) {
    return european_vanilla_crr_cpu(rate, up, down, maturity, start_price, strike, put_payoff,
                                    range);
}
