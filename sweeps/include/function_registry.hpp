#pragma once

#include <map>
#include <string>

#include "constants.hpp"

typedef double (*PricingFunction)(const PricingInput& input);

double path_enumeration_cpu(const PricingInput& input);
double scenario_sum_cpu(const PricingInput& input);
double scenario_sum_cpu_include_terminal_node(const PricingInput& input);

extern std::map<std::string, PricingFunction> FUNCTION_REGISTRY;
