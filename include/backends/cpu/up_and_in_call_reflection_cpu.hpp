#pragma once

#include <optional>

#include "constants.hpp"

// Relative tolerance for start_price * (1+up)^L == barrier in the barrier level search.
inline constexpr double BARRIER_LEVEL_TOLERANCE = 1e-12;

// First L in [0, maturity) with start_price * (1+up)^L == barrier.
std::optional<int> find_barrier_limit(const double up, const int maturity,
                                      const double start_price, const double barrier);

int barrier_limit(const double up, const int maturity, const double start_price,
                  const double barrier);

// Undiscounted call payoff over scenarios ending at or above the barrier. Scenarios are
// classified by their lattice exponent 2 * number_ups - maturity against barrier_limit.
double sum_above_barrier(const double rate, const double up, const double down,
                         const int maturity, const double start_price, const double strike,
                         const double barrier,
                         const SummationRange range = DEFAULT_SUMMATION_RANGE);

// Undiscounted expectation over paths that touch the barrier and end below it, obtained by
// reflecting them at the barrier level and rescaling the reflected measure.
double sum_below_reflected_barrier(const double rate, const double up, const double down,
                                   const int maturity, const double start_price,
                                   const double strike, const double barrier,
                                   const SummationRange range = DEFAULT_SUMMATION_RANGE);

/**
 * @brief Prices a European up-and-in call in the CRR model with the reflection principle.
 *
 * Requires a symmetric lattice, (1+up) * (1+down) == 1, and a barrier that equals
 * start_price * (1+up)^L for some L in [0, maturity). Symmetry is not checked; a barrier off the
 * lattice raises BarrierLevelNotFound.
 */
double up_and_in_call_reflection_cpu(const double rate, const double up, const double down,
                                     const int maturity, const double start_price,
                                     const double strike, const double barrier,
                                     const SummationRange range = DEFAULT_SUMMATION_RANGE);
