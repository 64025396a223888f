#include "sanity_checker.hpp"

#include <iostream>

std::vector<SanityCheckResult> sanity_check(const std::string& filter_function_name,
                                            const std::string& reference_function_name) {
    if (FUNCTION_REGISTRY.find(reference_function_name) == FUNCTION_REGISTRY.end()) {
        std::cerr << "Reference function '" << reference_function_name
                  << "' not found in function registry.\n";
        return {};
    }

    SanityChecker sanity_checker(reference_function_name,
                                 FUNCTION_REGISTRY[reference_function_name]);

    std::vector<SanityCheckResult> results;
    for (const auto& [name, func] : FUNCTION_REGISTRY) {
        // filter_function_name is a substring match
        if (name.find(filter_function_name) != std::string::npos || filter_function_name.empty()) {
            results.emplace_back(name, reference_function_name,
                                 sanity_checker.run_single_all_sanity_checks(func));
        }
    }
    return results;
}
