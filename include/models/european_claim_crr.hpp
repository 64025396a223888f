#pragma once

#include "constants.hpp"

struct PricingOptions {
    PricingMethod method = PricingMethod::ScenarioSum;
    SummationRange range = DEFAULT_SUMMATION_RANGE;
    // Run the precondition checks of core/validation.hpp before pricing.
    bool validate = false;
};

/**
 * @brief Prices a call, put or up-and-in call in the CRR binomial model.
 *
 * ScenarioSum sums over terminal scenarios (reflection identity for the up-and-in call);
 * PathEnumeration walks every lattice path and ignores options.range.
 *
 * @param input    Market, contract and contract type.
 * @param options  Method, summation range and whether to validate the input first.
 * @return The computed price.
 */
double european_claim_crr(const PricingInput& input, const PricingOptions& options = {});

double call_option_crr(const double rate, const double up, const double down, const int maturity,
                       const double start_price, const double strike,
                       const SummationRange range = DEFAULT_SUMMATION_RANGE);

double put_option_crr(const double rate, const double up, const double down, const int maturity,
                      const double start_price, const double strike,
                      const SummationRange range = DEFAULT_SUMMATION_RANGE);

double up_and_in_call_option_crr(const double rate, const double up, const double down,
                                 const int maturity, const double start_price,
                                 const double strike, const double barrier,
                                 const SummationRange range = DEFAULT_SUMMATION_RANGE);
