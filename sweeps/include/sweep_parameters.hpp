#pragma once

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "constants.hpp"

enum class SweepVariable { Maturity, Barrier, Strike, Rate };

inline std::string to_string(SweepVariable variable) {
    switch (variable) {
        case SweepVariable::Maturity:
            return "maturity";
        case SweepVariable::Barrier:
            return "barrier";
        case SweepVariable::Strike:
            return "strike";
        case SweepVariable::Rate:
            return "rate";
        default:
            return "unknown";
    }
}

// [start, stop) with unit step
inline std::vector<double> arange(int start, int stop) {
    std::vector<double> values;
    for (int i = start; i < stop; ++i) values.push_back(i);
    return values;
}

inline std::vector<double> linspace(double start, double stop, int count) {
    std::vector<double> values;
    if (count == 1) return {start};
    for (int i = 0; i < count; ++i) {
        values.push_back(start + (stop - start) * i / (count - 1));
    }
    return values;
}

inline std::vector<double> powers_of_two(int count) {
    std::vector<double> values;
    double value = 1.0;
    for (int i = 0; i < count; ++i, value *= 2.0) values.push_back(value);
    return values;
}

/**
 * @brief One price curve family: the contract is priced for every value of `variable`, once per
 * value of `series_variable`, everything else held at the base market and contract.
 */
class SweepParameters {
   public:
    std::string description;
    ContractType type;
    MarketModel market;
    ContractSpec contract;
    SweepVariable variable;
    std::vector<double> values;
    SweepVariable series_variable;
    std::vector<double> series_values;

    SweepParameters()
        : type(ContractType::UpAndInCall),
          variable(SweepVariable::Maturity),
          series_variable(SweepVariable::Rate) {}

    SweepParameters(const std::string& description, ContractType type, const MarketModel& market,
                    const ContractSpec& contract, SweepVariable variable,
                    const std::vector<double>& values, SweepVariable series_variable,
                    const std::vector<double>& series_values)
        : description(description),
          type(type),
          market(market),
          contract(contract),
          variable(variable),
          values(values),
          series_variable(series_variable),
          series_values(series_values) {}

    PricingInput pricing_input(double series_value, double value) const;
};

inline void apply_sweep_value(PricingInput& input, SweepVariable variable, double value) {
    switch (variable) {
        case SweepVariable::Maturity:
            input.contract.maturity = static_cast<int>(value);
            break;
        case SweepVariable::Barrier:
            input.contract.barrier = value;
            break;
        case SweepVariable::Strike:
            input.contract.strike = value;
            break;
        case SweepVariable::Rate:
            input.market.rate = value;
            break;
    }
}

inline PricingInput SweepParameters::pricing_input(double series_value, double value) const {
    PricingInput input(market, contract, type);
    apply_sweep_value(input, series_variable, series_value);
    apply_sweep_value(input, variable, value);
    return input;
}

inline std::string to_string(const SweepParameters& parameters) {
    return to_string(parameters.type) + " vs " + to_string(parameters.variable) + " (" +
           std::to_string(parameters.values.size()) + " points) per " +
           to_string(parameters.series_variable) + " in " +
           std::to_string(parameters.series_values.size()) + " series; base " +
           to_string(parameters.market) + ", " + to_string(parameters.contract);
}

extern std::map<std::string, SweepParameters> SWEEP_PARAMETERS;

inline void list_sweep_parameters() {
    std::cout << "Available sweep parameters identifiers:\n";
    for (const auto& [name, parameters] : SWEEP_PARAMETERS) {
        std::cout << "  - " << name << ": " << parameters.description << "\n";
        std::cout << "      " << to_string(parameters) << "\n";
    }
}
