#ifndef CASHALLOC_MONTE_CARLO_HPP
#define CASHALLOC_MONTE_CARLO_HPP

#include "parameters.hpp"
#include "scenario.hpp"
#include <cstddef>

namespace cashalloc {

constexpr size_t DEFAULT_MONTE_CARLO_RUNS = 1000;

// Aggregate survival statistics over independent simulated runs
struct SurvivalEstimate {
    double survival_probability;   // Fraction of runs that survived
    double mean_time_to_zero;      // Mean months_to_zero over runs that hit zero, +inf if none
    size_t runs;
    size_t runs_hit_zero;
    double execution_time_ms;

    SurvivalEstimate();
};

// Run the scenario simulator n_runs times and aggregate.
//
// One seed per run is drawn from rng before any run starts, so a seeded
// caller gets the same estimate regardless of how runs are scheduled.
// Runs execute in parallel when built with OpenMP.
//
// Throws std::invalid_argument if n_runs is 0.
SurvivalEstimate estimate(
    const ParameterSet& params,
    const AllocationStrategy& allocation,
    ScenarioKind scenario,
    size_t n_runs,
    RandomEngine& rng
);

// Same as above with DEFAULT_MONTE_CARLO_RUNS runs
SurvivalEstimate estimate(
    const ParameterSet& params,
    const AllocationStrategy& allocation,
    ScenarioKind scenario,
    RandomEngine& rng
);

} // namespace cashalloc

#endif // CASHALLOC_MONTE_CARLO_HPP
