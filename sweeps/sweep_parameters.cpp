#include "sweep_parameters.hpp"

// clang-format off
std::map<std::string, SweepParameters> SWEEP_PARAMETERS = {
    {"maturity", SweepParameters("Up-and-in call price vs maturity (strike=1, barrier=8)",
                                 ContractType::UpAndInCall, MarketModel(0.0, 1.0, -0.5), ContractSpec(20, 1, 1, 8),
                                 SweepVariable::Maturity, arange(4, 100),
                                 SweepVariable::Rate, {-0.25, 0.0, 0.25})},
    {"barrier", SweepParameters("Up-and-in call price vs barrier (strike=1, maturity=20)",
                                ContractType::UpAndInCall, MarketModel(0.0, 1.0, -0.5), ContractSpec(20, 1, 1, 8),
                                SweepVariable::Barrier, powers_of_two(15),
                                SweepVariable::Rate, {-0.25, 0.0, 0.25})},
    {"strike", SweepParameters("Up-and-in call price vs strike (barrier=128, maturity=20)",
                               ContractType::UpAndInCall, MarketModel(0.0, 1.0, -0.5), ContractSpec(20, 1, 1, 128),
                               SweepVariable::Strike, arange(0, 120),
                               SweepVariable::Rate, {-0.25, 0.0, 0.25})},
    {"rate", SweepParameters("Up-and-in call price vs interest rate (strike=1, maturity=20)",
                             ContractType::UpAndInCall, MarketModel(0.0, 1.0, -0.5), ContractSpec(20, 1, 1, 8),
                             SweepVariable::Rate, linspace(-0.49, 0.99, 100),
                             SweepVariable::Barrier, {2.0, 16.0, 128.0})},
    {"call-maturity", SweepParameters("Call price vs maturity (strike=1)",
                                      ContractType::Call, MarketModel(0.0, 1.0, -0.5), ContractSpec(20, 1, 1),
                                      SweepVariable::Maturity, arange(1, 100),
                                      SweepVariable::Rate, {-0.25, 0.0, 0.25})},
    {"put-maturity", SweepParameters("Put price vs maturity (strike=1)",
                                     ContractType::Put, MarketModel(0.0, 1.0, -0.5), ContractSpec(20, 1, 1),
                                     SweepVariable::Maturity, arange(1, 100),
                                     SweepVariable::Rate, {-0.25, 0.0, 0.25})},
    {"debug", SweepParameters("Small up-and-in call sweep for smoke tests",
                              ContractType::UpAndInCall, MarketModel(0.0, 1.0, -0.5), ContractSpec(20, 1, 1, 8),
                              SweepVariable::Barrier, {2.0, 3.0, 8.0},
                              SweepVariable::Rate, {0.0})},
};
// clang-format on
