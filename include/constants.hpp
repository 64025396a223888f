#pragma once

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

enum class ContractType { Call, Put, UpAndInCall };
enum class PricingMethod { ScenarioSum, PathEnumeration };
enum class Backend { CPU, OpenMP };
enum class OutputFormat { PPRINT, JSON };

// Which scenarios the pricing sums visit. ExcludeTerminalNode iterates number_ups over
// [0, maturity) and never visits the all-ups node; IncludeTerminalNode is the textbook
// [0, maturity] range.
enum class SummationRange { ExcludeTerminalNode, IncludeTerminalNode };

inline constexpr SummationRange DEFAULT_SUMMATION_RANGE = SummationRange::ExcludeTerminalNode;

constexpr int last_number_ups(const int maturity, const SummationRange range) noexcept {
    return (range == SummationRange::IncludeTerminalNode) ? maturity : maturity - 1;
}

inline std::string lowercase_transform(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

inline std::string to_string(ContractType type) {
    switch (type) {
        case ContractType::Call:
            return "Call";
        case ContractType::Put:
            return "Put";
        case ContractType::UpAndInCall:
            return "UpAndInCall";
        default:
            return "Unknown ContractType";
    }
}

inline std::string to_string(PricingMethod method) {
    switch (method) {
        case PricingMethod::ScenarioSum:
            return "ScenarioSum";
        case PricingMethod::PathEnumeration:
            return "PathEnumeration";
        default:
            return "Unknown PricingMethod";
    }
}

inline std::string to_string(Backend backend) {
    switch (backend) {
        case Backend::CPU:
            return "CPU";
        case Backend::OpenMP:
            return "OpenMP";
        default:
            return "Unknown Backend";
    }
}

inline std::string to_string(SummationRange range) {
    switch (range) {
        case SummationRange::ExcludeTerminalNode:
            return "ExcludeTerminalNode";
        case SummationRange::IncludeTerminalNode:
            return "IncludeTerminalNode";
        default:
            return "Unknown SummationRange";
    }
}

inline ContractType contract_type_from_string(const std::string& type) {
    std::string lower_type = lowercase_transform(type);
    if (lower_type == "call")
        return ContractType::Call;
    else if (lower_type == "put")
        return ContractType::Put;
    else if (lower_type == "ui-call" || lower_type == "upandincall")
        return ContractType::UpAndInCall;
    else
        throw std::invalid_argument("Invalid ContractType: " + type);
}

inline PricingMethod pricing_method_from_string(const std::string& method) {
    std::string lower_method = lowercase_transform(method);
    if (lower_method == "scenario-sum")
        return PricingMethod::ScenarioSum;
    else if (lower_method == "path-enumeration")
        return PricingMethod::PathEnumeration;
    else
        throw std::invalid_argument("Invalid PricingMethod: " + method);
}

inline Backend backend_from_string(const std::string& backend) {
    std::string lower_backend = lowercase_transform(backend);
    if (lower_backend == "cpu")
        return Backend::CPU;
    else if (lower_backend == "openmp")
        return Backend::OpenMP;
    else
        throw std::invalid_argument("Invalid Backend: " + backend);
}

inline OutputFormat output_format_from_string(const std::string& type) {
    std::string lower_type = lowercase_transform(type);
    if (lower_type == "pprint")
        return OutputFormat::PPRINT;
    else if (lower_type == "json")
        return OutputFormat::JSON;
    else
        throw std::invalid_argument("Invalid OutputFormat: " + type);
}

/**
 * @brief One-period CRR market: riskless rate and the up/down returns of the asset.
 *
 * No-arbitrage requires down < rate < up and rate > -1.
 */
struct MarketModel {
    double rate;
    double up;
    double down;

    MarketModel() : rate(0), up(0), down(0) {}
    MarketModel(double rate, double up, double down) : rate(rate), up(up), down(down) {}
};

/**
 * @brief Per-contract parameters. The barrier is only read by the up-and-in call.
 */
struct ContractSpec {
    int maturity;
    double start_price;
    double strike;
    double barrier;

    ContractSpec() : maturity(0), start_price(0), strike(0), barrier(0) {}

    ContractSpec(int maturity, double start_price, double strike)
        : maturity(maturity), start_price(start_price), strike(strike), barrier(0) {}

    ContractSpec(int maturity, double start_price, double strike, double barrier)
        : maturity(maturity), start_price(start_price), strike(strike), barrier(barrier) {}
};

class PricingInput {
   public:
    std::string name;
    MarketModel market;
    ContractSpec contract;
    ContractType type;

    PricingInput() : type(ContractType::Call) {}

    PricingInput(const MarketModel& market, const ContractSpec& contract, ContractType type)
        : name(""), market(market), contract(contract), type(type) {}

    PricingInput(const MarketModel& market, const ContractSpec& contract, ContractType type,
                 const std::string& name)
        : name(name), market(market), contract(contract), type(type) {}
};

inline std::string to_string(const MarketModel& market) {
    return "r=" + std::to_string(market.rate) + ", u=" + std::to_string(market.up) +
           ", d=" + std::to_string(market.down);
}

inline std::string to_string(const ContractSpec& contract) {
    return "n=" + std::to_string(contract.maturity) + ", S=" + std::to_string(contract.start_price) +
           ", K=" + std::to_string(contract.strike) + ", B=" + std::to_string(contract.barrier);
}
