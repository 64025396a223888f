#pragma once

#include <cmath>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "constants.hpp"
#include "function_registry.hpp"

// Absolute price difference above which a function disagrees with the reference.
inline constexpr double SANITY_CHECK_TOLERANCE = 1e-9;

// clang-format off
inline std::vector<PricingInput> SANITY_CHECK_PRICING_INPUTS = {
    PricingInput(MarketModel(0.0, 1.0, -0.5), ContractSpec(4, 1, 1, 8), ContractType::UpAndInCall, "Barrier at three ups, short maturity"),
    PricingInput(MarketModel(0.0, 1.0, -0.5), ContractSpec(5, 1, 1, 4), ContractType::UpAndInCall, "Barrier at two ups"),
    PricingInput(MarketModel(0.1, 1.0, -0.5), ContractSpec(6, 1, 1, 8), ContractType::UpAndInCall, "Positive rate up-and-in call"),
    PricingInput(MarketModel(-0.25, 1.0, -0.5), ContractSpec(8, 1, 1, 8), ContractType::UpAndInCall, "Negative rate up-and-in call"),
    PricingInput(MarketModel(0.25, 1.0, -0.5), ContractSpec(10, 1, 2, 16), ContractType::UpAndInCall, "High rate, strike above spot"),
    PricingInput(MarketModel(0.0, 1.0, -0.5), ContractSpec(4, 1, 1, 1), ContractType::UpAndInCall, "Barrier at spot"),
    PricingInput(MarketModel(0.0, 0.25, -0.2), ContractSpec(9, 100, 110, 156.25), ContractType::UpAndInCall, "Small moves, barrier at two ups"),
    PricingInput(MarketModel(0.05, 1.0, -0.5), ContractSpec(10, 1, 1), ContractType::Call, "Call on symmetric lattice"),
    PricingInput(MarketModel(0.05, 1.0, -0.5), ContractSpec(10, 1, 1), ContractType::Put, "Put on symmetric lattice"),
    PricingInput(MarketModel(0.01, 0.1, -0.05), ContractSpec(12, 100, 100), ContractType::Call, "Call on asymmetric lattice"),
    PricingInput(MarketModel(0.01, 0.1, -0.05), ContractSpec(12, 100, 120), ContractType::Put, "Put on asymmetric lattice"),
};
// clang-format on

typedef std::vector<std::tuple<PricingInput, double, double>> SanityCheckResults;

class SanityChecker {
   public:
    std::string reference_function_name;
    PricingFunction reference_function;
    std::vector<std::pair<PricingInput, double>> reference_function_results;

    SanityChecker(std::string name, PricingFunction function)
        : reference_function_name(std::move(name)), reference_function(function) {
        for (const auto& input : SANITY_CHECK_PRICING_INPUTS) {
            reference_function_results.push_back(
                std::make_pair(input, reference_function(input)));
        }
    }

    SanityCheckResults run_single_all_sanity_checks(PricingFunction func) const {
        SanityCheckResults test_results;
        for (const auto& [input, expected] : reference_function_results) {
            double price = func(input);
            if (!(std::abs(price - expected) <= SANITY_CHECK_TOLERANCE)) {
                test_results.emplace_back(input, expected, price);
            }
        }
        return test_results;
    }
};

class SanityCheckResult {
   public:
    std::string function_name;
    std::string reference_function_name;
    SanityCheckResults mismatches;

    SanityCheckResult(std::string function_name, std::string reference_function_name,
                      SanityCheckResults mismatches)
        : function_name(std::move(function_name)),
          reference_function_name(std::move(reference_function_name)),
          mismatches(std::move(mismatches)) {}

    bool pass_sanity_check() const { return mismatches.empty(); }
};

std::vector<SanityCheckResult> sanity_check(const std::string& filter_function_name,
                                            const std::string& reference_function_name);
