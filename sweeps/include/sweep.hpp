#pragma once

#include <string>
#include <vector>

#include "constants.hpp"
#include "sanity_checker.hpp"
#include "sweep_parameters.hpp"

class SweepPoint {
   public:
    double value = 0.0;
    double price = 0.0;
    // Empty unless pricing this point raised, e.g. a barrier off the lattice.
    std::string error;

    bool ok() const { return error.empty(); }
};

class SweepSeriesResult {
   public:
    double series_value;
    std::vector<SweepPoint> points;

    explicit SweepSeriesResult(double series_value) : series_value(series_value) {}
};

class SweepResult {
   public:
    std::string parameters_name;
    SweepParameters parameters;
    Backend backend;
    SummationRange range;
    int threads;
    double execution_time_ms;
    std::vector<SweepSeriesResult> series;

    SweepResult(const std::string& parameters_name, const SweepParameters& parameters,
                Backend backend, SummationRange range)
        : parameters_name(parameters_name),
          parameters(parameters),
          backend(backend),
          range(range),
          threads(1),
          execution_time_ms(0.0) {}

    int failed_points() const {
        int failed = 0;
        for (const auto& s : series)
            for (const auto& p : s.points) failed += !p.ok();
        return failed;
    }
};

/**
 * @brief Prices every (series value, value) point of a sweep.
 *
 * Points are independent; with Backend::OpenMP they are spread over the OpenMP threads. A point
 * that throws keeps its message in SweepPoint::error and the sweep carries on.
 */
SweepResult run_sweep(const std::string& parameters_name, const SweepParameters& parameters,
                      const Backend backend,
                      const SummationRange range = DEFAULT_SUMMATION_RANGE);

/**
 * @brief Looks up a preset in SWEEP_PARAMETERS and runs it. Returns an empty vector after
 * reporting on stderr when the identifier is unknown.
 */
std::vector<SweepResult> sweep(const std::string& parameters_name, const Backend backend,
                               const SummationRange range = DEFAULT_SUMMATION_RANGE);
