#include "backends/cpu/path_enumeration_cpu.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "core/payoffs.hpp"
#include "core/risk_neutral_measure.hpp"
#include "errors.hpp"

double european_claim_path_enumeration_cpu(const MarketModel& market, const ContractSpec& contract,
                                           const ContractType type) {
    const int n = contract.maturity;
    if (n < 0 || n > MAX_PATH_ENUMERATION_MATURITY) {
        throw InvalidModelParameters("Path enumeration supports maturities in [0, " +
                                     std::to_string(MAX_PATH_ENUMERATION_MATURITY) + "], got " +
                                     std::to_string(n));
    }

    const double up_return = 1.0 + market.up;
    const double down_return = 1.0 + market.down;
    const RiskNeutralMeasure measure = derive_measure(market);

    std::vector<double> path(n + 1);
    path[0] = contract.start_price;

    double expected_value = 0.0;
    const std::uint64_t n_paths = std::uint64_t(1) << n;
    for (std::uint64_t moves = 0; moves < n_paths; ++moves) {
        // Bit t of moves set means an up-move at step t + 1.
        int number_ups = 0;
        for (int t = 0; t < n; ++t) {
            const bool is_up = (moves >> t) & 1u;
            number_ups += is_up;
            path[t + 1] = path[t] * (is_up ? up_return : down_return);
        }

        double pay = 0.0;
        switch (type) {
            case ContractType::Call:
                pay = call_payoff(path.back(), contract.strike);
                break;
            case ContractType::Put:
                pay = put_payoff(path.back(), contract.strike);
                break;
            case ContractType::UpAndInCall:
                pay = up_and_in_call_payoff(path, contract.strike, contract.barrier);
                break;
        }
        if (pay == 0.0) {
            continue;
        }
        const double weight = std::pow(measure.probability_up, number_ups) *
                              std::pow(measure.probability_down, n - number_ups);
        expected_value += weight * pay;
    }
    return expected_value / std::pow(1.0 + market.rate, n);
}
