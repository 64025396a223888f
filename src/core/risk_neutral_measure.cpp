#include "core/risk_neutral_measure.hpp"

RiskNeutralMeasure derive_measure(const double rate, const double up, const double down) {
    const double probability_up = (rate - down) / (up - down);
    return RiskNeutralMeasure{probability_up, 1.0 - probability_up};
}
