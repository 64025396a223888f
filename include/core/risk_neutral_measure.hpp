#pragma once

#include "constants.hpp"

struct RiskNeutralMeasure {
    double probability_up;
    double probability_down;
};

// Unchecked: outside down < rate < up the pair leaves (0, 1).
RiskNeutralMeasure derive_measure(const double rate, const double up, const double down);

inline RiskNeutralMeasure derive_measure(const MarketModel& market) {
    return derive_measure(market.rate, market.up, market.down);
}
