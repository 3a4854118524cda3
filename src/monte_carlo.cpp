#include "monte_carlo.hpp"
#include "logger.hpp"
#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace cashalloc {

SurvivalEstimate::SurvivalEstimate()
    : survival_probability(0.0),
      mean_time_to_zero(std::numeric_limits<double>::infinity()),
      runs(0),
      runs_hit_zero(0),
      execution_time_ms(0.0) {}

SurvivalEstimate estimate(
    const ParameterSet& params,
    const AllocationStrategy& allocation,
    ScenarioKind scenario,
    size_t n_runs,
    RandomEngine& rng)
{
    if (n_runs == 0) {
        throw std::invalid_argument("Monte Carlo estimate requires at least one run");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<uint64_t> seeds(n_runs);
    for (auto& seed : seeds) {
        seed = rng();
    }

    // Trajectories are discarded, only the survival flag and time-to-zero matter
    const long long count = static_cast<long long>(n_runs);
    long long survived_count = 0;
    long long hit_zero_count = 0;
    double time_to_zero_sum = 0.0;

#ifdef HAVE_OPENMP
    #pragma omp parallel for reduction(+:survived_count, hit_zero_count, time_to_zero_sum) schedule(static)
#endif
    for (long long i = 0; i < count; ++i) {
        RandomEngine run_rng(seeds[static_cast<size_t>(i)]);
        SimulationResult run = simulate(params, allocation, scenario, run_rng);
        if (run.survived) {
            survived_count += 1;
        }
        if (run.hit_zero()) {
            hit_zero_count += 1;
            time_to_zero_sum += run.months_to_zero;
        }
    }

    SurvivalEstimate result;
    result.runs = n_runs;
    result.runs_hit_zero = static_cast<size_t>(hit_zero_count);
    result.survival_probability =
        static_cast<double>(survived_count) / static_cast<double>(n_runs);
    if (hit_zero_count > 0) {
        result.mean_time_to_zero = time_to_zero_sum / static_cast<double>(hit_zero_count);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    Logger::get_instance().log_monte_carlo_complete(scenario_name(scenario), result.runs,
                                                   result.survival_probability,
                                                   result.mean_time_to_zero,
                                                   result.execution_time_ms);
    return result;
}

SurvivalEstimate estimate(
    const ParameterSet& params,
    const AllocationStrategy& allocation,
    ScenarioKind scenario,
    RandomEngine& rng)
{
    return estimate(params, allocation, scenario, DEFAULT_MONTE_CARLO_RUNS, rng);
}

} // namespace cashalloc
