#pragma once

#include "constants.hpp"

// Largest maturity the path enumeration accepts; the work grows as 2^maturity.
inline constexpr int MAX_PATH_ENUMERATION_MATURITY = 24;

/**
 * @brief Prices a European claim by walking every one of the 2^maturity lattice paths.
 *
 * The all-ups scenario is always included. Throws InvalidModelParameters when maturity is
 * outside [0, MAX_PATH_ENUMERATION_MATURITY].
 */
double european_claim_path_enumeration_cpu(const MarketModel& market, const ContractSpec& contract,
                                           const ContractType type);

inline double up_and_in_call_path_enumeration_cpu(const double rate, const double up,
                                                  const double down, const int maturity,
                                                  const double start_price, const double strike,
                                                  const double barrier) {
    return european_claim_path_enumeration_cpu(MarketModel(rate, up, down),
                                               ContractSpec(maturity, start_price, strike, barrier),
                                               ContractType::UpAndInCall);
}
