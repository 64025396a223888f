#include "models/european_claim_crr.hpp"

#include <stdexcept>

#include "backends/cpu/european_vanilla_crr_cpu.hpp"
#include "backends/cpu/path_enumeration_cpu.hpp"
#include "backends/cpu/up_and_in_call_reflection_cpu.hpp"
#include "core/validation.hpp"

double call_option_crr(const double rate, const double up, const double down, const int maturity,
                       const double start_price, const double strike,
                       const SummationRange range) {
    return european_call_crr_cpu(rate, up, down, maturity, start_price, strike, range);
}

double put_option_crr(const double rate, const double up, const double down, const int maturity,
                      const double start_price, const double strike,
                      const SummationRange range) {
    return european_put_crr_cpu(rate, up, down, maturity, start_price, strike, range);
}

double up_and_in_call_option_crr(const double rate, const double up, const double down,
                                 const int maturity, const double start_price,
                                 const double strike, const double barrier,
                                 const SummationRange range) {
    return up_and_in_call_reflection_cpu(rate, up, down, maturity, start_price, strike, barrier,
                                         range);
}

double european_claim_crr(const PricingInput& input, const PricingOptions& options) {
    if (options.validate) {
        validate_pricing_input(input);
    }

    const MarketModel& m = input.market;
    const ContractSpec& c = input.contract;

    if (options.method == PricingMethod::PathEnumeration) {
        return european_claim_path_enumeration_cpu(m, c, input.type);
    } else if (options.method != PricingMethod::ScenarioSum) {
        throw std::invalid_argument("Unknown pricing method: " + to_string(options.method));
    }

    switch (input.type) {
        case ContractType::Call:
            return call_option_crr(m.rate, m.up, m.down, c.maturity, c.start_price, c.strike,
                                   options.range);
        case ContractType::Put:
            return put_option_crr(m.rate, m.up, m.down, c.maturity, c.start_price, c.strike,
                                  options.range);
        case ContractType::UpAndInCall:
            return up_and_in_call_option_crr(m.rate, m.up, m.down, c.maturity, c.start_price,
                                             c.strike, c.barrier, options.range);
        default:
            throw std::invalid_argument("Unknown contract type: " + to_string(input.type));
    }
}
