#include "core/validation.hpp"

#include <cmath>

#include "errors.hpp"

void validate_market_model(const MarketModel& market) {
    if (!(market.rate > -1.0)) {
        throw InvalidModelParameters("Riskless rate must be greater than -1 (" +
                                     to_string(market) + ")");
    }
    if (!(market.down < market.rate && market.rate < market.up)) {
        throw InvalidModelParameters("No-arbitrage condition down < rate < up violated (" +
                                     to_string(market) + ")");
    }
}

void validate_contract(const ContractSpec& contract, const ContractType type) {
    if (contract.maturity < 1) {
        throw InvalidModelParameters("Maturity must be at least one step (" +
                                     to_string(contract) + ")");
    }
    if (!(contract.start_price > 0.0)) {
        throw InvalidModelParameters("Start price must be positive (" + to_string(contract) + ")");
    }
    if (!(contract.strike > 0.0)) {
        throw InvalidModelParameters("Strike must be positive (" + to_string(contract) + ")");
    }
    if (type == ContractType::UpAndInCall && !(contract.barrier > contract.strike)) {
        throw InvalidModelParameters("Barrier must lie above the strike (" + to_string(contract) +
                                     ")");
    }
}

void validate_symmetric_lattice(const MarketModel& market) {
    const double product = (1.0 + market.up) * (1.0 + market.down);
    if (std::abs(product - 1.0) > SYMMETRIC_LATTICE_TOLERANCE) {
        throw InvalidModelParameters(
            "Up-and-in pricing requires a symmetric lattice (1 + u) * (1 + d) == 1 (" +
            to_string(market) + ")");
    }
}

void validate_pricing_input(const PricingInput& input) {
    validate_market_model(input.market);
    validate_contract(input.contract, input.type);
    if (input.type == ContractType::UpAndInCall) {
        validate_symmetric_lattice(input.market);
    }
}
