#include "sweep.hpp"

#include <omp.h>

#include <chrono>
#include <exception>
#include <iostream>

#include "models/european_claim_crr.hpp"

SweepResult run_sweep(const std::string& parameters_name, const SweepParameters& parameters,
                      const Backend backend, const SummationRange range) {
    SweepResult result(parameters_name, parameters, backend, range);
    for (double series_value : parameters.series_values) {
        SweepSeriesResult series(series_value);
        series.points.resize(parameters.values.size());
        result.series.push_back(series);
    }

    PricingOptions options;
    options.range = range;

    const int n_values = static_cast<int>(parameters.values.size());
    const int n_points = n_values * static_cast<int>(parameters.series_values.size());
    const bool parallel = (backend == Backend::OpenMP);
    result.threads = parallel ? omp_get_max_threads() : 1;

    auto start = std::chrono::high_resolution_clock::now();
#pragma omp parallel for schedule(dynamic) if (parallel)
    for (int i = 0; i < n_points; ++i) {
        const int s = i / n_values;
        const int v = i % n_values;
        SweepPoint& point = result.series[s].points[v];
        point.value = parameters.values[v];
        try {
            PricingInput input =
                parameters.pricing_input(parameters.series_values[s], parameters.values[v]);
            point.price = european_claim_crr(input, options);
        } catch (const std::exception& e) {
            point.error = e.what();
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> duration = end - start;
    result.execution_time_ms = duration.count();

    return result;
}

std::vector<SweepResult> sweep(const std::string& parameters_name, const Backend backend,
                               const SummationRange range) {
    if (SWEEP_PARAMETERS.find(parameters_name) == SWEEP_PARAMETERS.end()) {
        std::cerr << "Sweep parameters identifier '" << parameters_name << "' not found.\n";
        return {};
    }
    return {run_sweep(parameters_name, SWEEP_PARAMETERS[parameters_name], backend, range)};
}
