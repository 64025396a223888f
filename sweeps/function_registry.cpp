#include "function_registry.hpp"

#include "backends/cpu/path_enumeration_cpu.hpp"
#include "models/european_claim_crr.hpp"

double path_enumeration_cpu(const PricingInput& input) {
    return european_claim_path_enumeration_cpu(input.market, input.contract, input.type);
}

double scenario_sum_cpu(const PricingInput& input) {
    return european_claim_crr(input);
}

double scenario_sum_cpu_include_terminal_node(const PricingInput& input) {
    PricingOptions options;
    options.range = SummationRange::IncludeTerminalNode;
    return european_claim_crr(input, options);
}

// clang-format off
std::map<std::string, PricingFunction> FUNCTION_REGISTRY = {
    {"path_enumeration_cpu", path_enumeration_cpu},
    {"scenario_sum_cpu", scenario_sum_cpu},
    {"scenario_sum_cpu_include_terminal_node", scenario_sum_cpu_include_terminal_node},
};
// clang-format on
