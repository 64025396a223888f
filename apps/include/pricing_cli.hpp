#pragma once

#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "sanity_checker.hpp"
#include "sweep.hpp"

template <typename T>
inline std::string to_string_with_precision(const T a_value, const int n = 6) {
    std::ostringstream out;
    out.precision(n);
    out << std::fixed << a_value;
    return out.str();
}

// Printing helpers used by the CLI
void print_table(const std::vector<std::vector<std::string>>& table,
                 const std::vector<int>& min_width = {});
void print_sanity_checks(const std::vector<SanityCheckResult>& results);
void print_sweep_result_pprint(const SweepResult& result);
void print_error(const std::string& message);

nlohmann::json dump_sweep_result_json(const SweepResult& result);
nlohmann::json dump_sanity_checks_json(const std::vector<SanityCheckResult>& results);
