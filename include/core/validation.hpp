#pragma once

#include "constants.hpp"

// Relative tolerance used to accept (1 + up) * (1 + down) == 1 as a symmetric lattice.
inline constexpr double SYMMETRIC_LATTICE_TOLERANCE = 1e-12;

void validate_market_model(const MarketModel& market);

// barrier > strike is only required for the up-and-in call.
void validate_contract(const ContractSpec& contract, const ContractType type);

void validate_symmetric_lattice(const MarketModel& market);

void validate_pricing_input(const PricingInput& input);
