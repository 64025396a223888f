#include "core/payoffs.hpp"

#include <algorithm>

double call_payoff(const double asset_price, const double strike) {
    return std::max(asset_price - strike, 0.0);
}

double put_payoff(const double asset_price, const double strike) {
    return std::max(strike - asset_price, 0.0);
}

bool barrier_crossed(const std::vector<double>& asset_prices, const double barrier) {
    for (const double price : asset_prices) {
        if (price >= barrier) {
            return true;
        }
    }
    return false;
}

double up_and_in_call_payoff(const std::vector<double>& asset_prices, const double strike,
                             const double barrier) {
    if (asset_prices.empty() || !barrier_crossed(asset_prices, barrier)) {
        return 0.0;
    }
    return call_payoff(asset_prices.back(), strike);
}
