#pragma once

#include <stdexcept>
#include <string>

// Raised by the opt-in validators when a market or contract breaks a pricing precondition.
class InvalidModelParameters : public std::invalid_argument {
   public:
    explicit InvalidModelParameters(const std::string& what) : std::invalid_argument(what) {}
};

// Raised when no number of up-moves inside the lattice lands exactly on the barrier.
class BarrierLevelNotFound : public std::runtime_error {
   public:
    BarrierLevelNotFound(double barrier, double start_price, double up, int maturity)
        : std::runtime_error("no valid barrier crossing level found for given parameters (B=" +
                             std::to_string(barrier) + ", S=" + std::to_string(start_price) +
                             ", u=" + std::to_string(up) + ", n=" + std::to_string(maturity) +
                             ")"),
          barrier(barrier) {}

    double barrier;
};
