#include "include/pricing_cli.hpp"

#include <CLI/CLI.hpp>
#include <cstdio>
#include <exception>
#include <iostream>
#include <nlohmann/json.hpp>
#include <rang.hpp>
#include <string>

#include "constants.hpp"
#include "errors.hpp"
#include "models/european_claim_crr.hpp"
#include "sanity_checker.hpp"
#include "sweep.hpp"
#include "sweep_parameters.hpp"

int main(int argc, char** argv) {
    CLI::App app{"CLI for European claims in the CRR binomial model"};

    // Pricing subcommand
    std::string contract_type_str, pricing_method_str, backend_str, output_format_str;
    double r, u, d, S, K, B;
    int n;
    bool include_terminal_node = false;
    bool validate = false;

    auto price_subcommand = app.add_subcommand("price", "Run a single pricing query");
    price_subcommand->add_option("--type", contract_type_str, "Contract type (call|put|ui-call)")
        ->default_val("call")
        ->check(CLI::IsMember({"call", "put", "ui-call"}));
    price_subcommand
        ->add_option("--method", pricing_method_str,
                     "Pricing method (scenario-sum|path-enumeration)")
        ->default_val("scenario-sum")
        ->check(CLI::IsMember({"scenario-sum", "path-enumeration"}));
    price_subcommand->add_option("-r", r, "Riskless rate per step")->default_val(0.0);
    price_subcommand->add_option("-u", u, "Asset return in the up scenario")->default_val(1.0);
    price_subcommand->add_option("-d", d, "Asset return in the down scenario")->default_val(-0.5);
    price_subcommand->add_option("-n", n, "Maturity (number of binomial steps)")->default_val(20);
    price_subcommand->add_option("-S", S, "Start price")->default_val(1.0);
    price_subcommand->add_option("-K", K, "Strike price")->default_val(1.0);
    price_subcommand->add_option("--barrier", B, "Barrier of the up-and-in call")
        ->default_val(8.0);
    price_subcommand->add_flag("--include-terminal-node", include_terminal_node,
                               "Sum over number_ups in [0, n] instead of [0, n)");
    price_subcommand->add_flag("--validate", validate,
                               "Reject parameters that break the model preconditions");

    // Sweep subcommand
    std::string sweep_parameters;
    auto sweep_subcommand =
        app.add_subcommand("sweep", "Price a contract over a named parameter sweep");
    sweep_subcommand->add_option("--parameters", sweep_parameters, "Sweep parameters identifier")
        ->default_val("barrier");
    sweep_subcommand->add_option("--backend", backend_str, "Backend (cpu|openmp)")
        ->default_val("cpu")
        ->check(CLI::IsMember({"cpu", "openmp"}));
    sweep_subcommand
        ->add_option("--output-format", output_format_str, "Output Format (pprint|json)")
        ->default_val("pprint")
        ->check(CLI::IsMember({"pprint", "json"}));
    sweep_subcommand->add_flag("--include-terminal-node", include_terminal_node,
                               "Sum over number_ups in [0, n] instead of [0, n)");

    // List parameters subcommand
    auto list_parameters_subcommand = app.add_subcommand(
        "sweep-parameters", "List available sweep parameters and their config");

    // Sanity check subcommand
    std::string filter_name, reference_function_name;
    auto sanity_check_subcommand = app.add_subcommand(
        "sanity-check", "Compare the registered pricing functions against a reference");
    sanity_check_subcommand
        ->add_option("--filter-by-name", filter_name, "Filter functions by name")
        ->default_val("");
    sanity_check_subcommand
        ->add_option("--reference-function", reference_function_name,
                     "Reference function name for sanity checks")
        ->default_val("path_enumeration_cpu");
    sanity_check_subcommand
        ->add_option("--output-format", output_format_str, "Output Format (pprint|json)")
        ->default_val("pprint")
        ->check(CLI::IsMember({"pprint", "json"}));

    try {
        app.require_subcommand(1);
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    const SummationRange range = include_terminal_node ? SummationRange::IncludeTerminalNode
                                                       : DEFAULT_SUMMATION_RANGE;

    try {
        if (*price_subcommand) {
            PricingInput input(MarketModel(r, u, d), ContractSpec(n, S, K, B),
                               contract_type_from_string(contract_type_str));
            PricingOptions options;
            options.method = pricing_method_from_string(pricing_method_str);
            options.range = range;
            options.validate = validate;

            double price = european_claim_crr(input, options);
            printf("Option Price: %.6f\n", price);
        } else if (*sweep_subcommand) {
            OutputFormat output_format = output_format_from_string(output_format_str);
            Backend backend = backend_from_string(backend_str);

            auto results = sweep(sweep_parameters, backend, range);
            if (results.empty()) {
                std::cout << rang::fg::yellow << "Use 'sweep-parameters' to list identifiers."
                          << rang::fg::reset << "\n";
                return 1;
            }
            if (output_format == OutputFormat::PPRINT) {
                for (const auto& result : results) print_sweep_result_pprint(result);
            } else if (output_format == OutputFormat::JSON) {
                nlohmann::json output = nlohmann::json::array();
                for (const auto& result : results) output.push_back(dump_sweep_result_json(result));
                std::cout << output.dump(1, '\t') << std::endl;
            }
        } else if (*list_parameters_subcommand) {
            list_sweep_parameters();
        } else if (*sanity_check_subcommand) {
            OutputFormat output_format = output_format_from_string(output_format_str);

            auto results = sanity_check(filter_name, reference_function_name);
            if (results.empty()) {
                std::cout << rang::fg::yellow
                          << "No functions matched the given filter: " << filter_name
                          << rang::fg::reset << "\n";
                return 0;
            }
            if (output_format == OutputFormat::PPRINT) {
                print_sanity_checks(results);
            } else if (output_format == OutputFormat::JSON) {
                std::cout << dump_sanity_checks_json(results).dump(1, '\t') << std::endl;
            }
        }
    } catch (const BarrierLevelNotFound& e) {
        print_error(e.what());
        return 1;
    } catch (const InvalidModelParameters& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }

    return 0;
}
