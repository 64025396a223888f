#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <rang.hpp>
#include <sstream>

#include "constants.hpp"
#include "include/pricing_cli.hpp"

void print_error(const std::string& message) {
    std::cerr << rang::fg::red << rang::style::bold << "Error: " << rang::style::reset
              << rang::fg::red << message << rang::fg::reset << "\n";
}

void print_table(const std::vector<std::vector<std::string>>& table,
                 const std::vector<int>& min_width) {
    if (table.empty()) return;

    // Columns grow to their widest cell; the first column is left-aligned, the rest right.
    std::vector<size_t> width(min_width.begin(), min_width.end());
    for (const auto& row : table) {
        if (row.size() > width.size()) width.resize(row.size(), 0);
        for (size_t c = 0; c < row.size(); ++c) width[c] = std::max(width[c], row[c].size());
    }
    size_t rule = width.empty() ? 0 : width.size() - 1;
    for (size_t w : width) rule += w;

    auto print_row = [&](const std::vector<std::string>& row) {
        for (size_t c = 0; c < width.size(); ++c) {
            const std::string& cell = (c < row.size()) ? row[c] : std::string("-");
            if (c == 0) {
                std::cout << std::left << std::setw(static_cast<int>(width[c])) << cell;
            } else {
                std::cout << ' ' << std::right << std::setw(static_cast<int>(width[c])) << cell;
            }
        }
        std::cout << "\n";
    };

    std::cout << std::string(rule, '-') << "\n" << rang::style::bold;
    print_row(table[0]);
    std::cout << rang::style::reset << std::string(rule, '-') << "\n";
    for (size_t r = 1; r < table.size(); ++r) print_row(table[r]);
    std::cout << std::string(rule, '-') << "\n\n";
}

void print_sanity_checks(const std::vector<SanityCheckResult>& results) {
    std::cout << "\n"
              << rang::style::bold << "=== SANITY CHECKS SUMMARY ===" << rang::style::reset
              << "\n\n";
    for (const auto& result : results) {
        for (const auto& [input, expected, price] : result.mismatches) {
            std::cout << "Mismatch in " << result.function_name << " vs "
                      << result.reference_function_name << " (input: '" << input.name
                      << "'): expected " << to_string_with_precision(expected, 12) << ", got "
                      << to_string_with_precision(price, 12)
                      << " (diff = " << std::abs(price - expected) << ")\n";
        }
    }
    std::cout << "\n";

    std::vector<std::vector<std::string>> table;
    table.push_back({"Function", "Status"});

    for (const auto& res : results) {
        std::string status = res.pass_sanity_check() ? "✅" : "❌";
        table.push_back({res.function_name, status});
    }

    print_table(table, {0, 6});
}

void print_sweep_result_pprint(const SweepResult& result) {
    const SweepParameters& parameters = result.parameters;
    std::cout << "\n"
              << rang::style::bold << "=== SWEEP '" << result.parameters_name
              << "' ===" << rang::style::reset << "\n";
    std::cout << parameters.description << "\n";
    std::cout << to_string(parameters) << "\n";
    std::cout << "Backend: " << to_string(result.backend) << " (" << result.threads
              << " threads), summation range: " << to_string(result.range)
              << ", time: " << to_string_with_precision(result.execution_time_ms, 3) << " ms\n\n";

    std::vector<std::string> header = {to_string(parameters.variable)};
    for (const auto& series : result.series) {
        header.push_back(to_string(parameters.series_variable) + "=" +
                         to_string_with_precision(series.series_value, 2));
    }

    std::vector<std::vector<std::string>> table;
    table.push_back(header);
    for (size_t v = 0; v < parameters.values.size(); ++v) {
        std::vector<std::string> row;
        row.push_back(to_string_with_precision(parameters.values[v], 4));
        for (const auto& series : result.series) {
            const SweepPoint& point = series.points[v];
            row.push_back(point.ok() ? to_string_with_precision(point.price, 8) : "n/a");
        }
        table.push_back(row);
    }
    print_table(table, {10});

    if (result.failed_points() > 0) {
        std::cout << rang::fg::yellow << result.failed_points()
                  << " point(s) could not be priced:" << rang::fg::reset << "\n";
        for (const auto& series : result.series) {
            for (const auto& point : series.points) {
                if (!point.ok()) {
                    std::cout << "  " << to_string(parameters.series_variable) << "="
                              << series.series_value << ", " << to_string(parameters.variable)
                              << "=" << point.value << ": " << point.error << "\n";
                }
            }
        }
        std::cout << "\n";
    }
}

nlohmann::json dump_market_json(const MarketModel& market) {
    return nlohmann::json{{"r", market.rate}, {"u", market.up}, {"d", market.down}};
}

nlohmann::json dump_contract_json(const ContractSpec& contract) {
    return nlohmann::json{{"n", contract.maturity},
                          {"S", contract.start_price},
                          {"K", contract.strike},
                          {"B", contract.barrier}};
}

nlohmann::json dump_sweep_result_json(const SweepResult& result) {
    const SweepParameters& parameters = result.parameters;
    nlohmann::json::array_t series_json;
    for (const auto& series : result.series) {
        nlohmann::json::array_t values, prices, errors;
        for (const auto& point : series.points) {
            values.push_back(point.value);
            if (point.ok()) {
                prices.push_back(point.price);
            } else {
                prices.push_back(nullptr);
                errors.push_back({{"value", point.value}, {"message", point.error}});
            }
        }
        series_json.push_back({{to_string(parameters.series_variable), series.series_value},
                               {"values", values},
                               {"prices", prices},
                               {"errors", errors}});
    }

    return nlohmann::json{{"id", result.parameters_name},
                          {"description", parameters.description},
                          {"contract_type", to_string(parameters.type)},
                          {"varying", to_string(parameters.variable)},
                          {"series_variable", to_string(parameters.series_variable)},
                          {"market", dump_market_json(parameters.market)},
                          {"contract", dump_contract_json(parameters.contract)},
                          {"backend", to_string(result.backend)},
                          {"threads", result.threads},
                          {"summation_range", to_string(result.range)},
                          {"time_ms", result.execution_time_ms},
                          {"series", series_json}};
}

nlohmann::json dump_sanity_checks_json(const std::vector<SanityCheckResult>& results) {
    nlohmann::json::array_t output;
    for (const auto& res : results) {
        nlohmann::json::array_t mismatches;
        for (const auto& [input, expected, price] : res.mismatches) {
            mismatches.push_back({{"test_name", input.name},
                                  {"contract_type", to_string(input.type)},
                                  {"market", dump_market_json(input.market)},
                                  {"contract", dump_contract_json(input.contract)},
                                  {"expected", expected},
                                  {"price", price}});
        }
        output.push_back({{"id", res.function_name},
                          {"reference", res.reference_function_name},
                          {"do_pass_sanity_check", res.pass_sanity_check()},
                          {"mismatches", mismatches}});
    }
    return output;
}
