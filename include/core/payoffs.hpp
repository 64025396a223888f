#pragma once

#include <vector>

typedef double (*PayoffFunction)(const double asset_price, const double strike);

typedef double (*PathPayoffFunction)(const std::vector<double>& asset_prices, const double strike,
                                     const double barrier);

double call_payoff(const double asset_price, const double strike);

double put_payoff(const double asset_price, const double strike);

bool barrier_crossed(const std::vector<double>& asset_prices, const double barrier);

// Call payoff of the last price, 0 unless the barrier was reached.
double up_and_in_call_payoff(const std::vector<double>& asset_prices, const double strike,
                             const double barrier);
