#ifndef CASHALLOC_SCENARIO_HPP
#define CASHALLOC_SCENARIO_HPP

#include "parameters.hpp"
#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace cashalloc {

// Random source threaded through simulation and training-data generation
using RandomEngine = std::mt19937_64;

enum class ScenarioKind : uint8_t {
    Good = 0,
    Neutral = 1,
    Bad = 2
};

constexpr std::array<ScenarioKind, 3> ALL_SCENARIOS = {
    ScenarioKind::Good, ScenarioKind::Neutral, ScenarioKind::Bad
};

std::string scenario_name(ScenarioKind kind);
ScenarioKind parse_scenario_kind(const std::string& name);

// Multipliers applied to cash, expenses and investment returns
struct ScenarioMultipliers {
    double cash;
    double expense;
    double ret;
};

// Fixed policy table:
//   good:    1 + vol,   0.9, 1.2
//   neutral: 1.0,       1.0, 1.0
//   bad:     1 - 2*vol, 1.2, 0.5
ScenarioMultipliers scenario_multipliers(ScenarioKind kind, double cash_volatility);

// Balance of each capital tier at a point in time
struct TierBalances {
    double reserve;
    double growth;
    double risk;

    double total() const { return reserve + growth + risk; }
};

// Apply one month's operating result to the tiers.
// A surplus goes to the reserve. A shortfall drains reserve first, then
// growth, then risk; anything beyond the risk tier is dropped (no debt).
void apply_operating_result(TierBalances& tiers, double operating_result);

struct SimulationOptions {
    bool apply_noise;     // If false, every normal shock is zero
    bool record_tiers;    // If true, populate SimulationResult::tiers

    SimulationOptions();
};

// Outcome of one simulated trajectory
struct SimulationResult {
    ScenarioKind scenario;
    bool survived;
    double months_to_zero;                // +infinity if cash never hit zero
    double survival_probability;          // Single-run value, see simulate()
    std::vector<double> trajectory;       // Total cash, horizon + 1 points
    std::vector<TierBalances> tiers;      // Same length as trajectory when recorded

    SimulationResult();

    bool hit_zero() const;
    double final_cash() const;
};

// Run one month-by-month trajectory of horizon = protected_months + 12.
//
// Each month:
//   1. Draw revenue (expected * cash multiplier, shocked, floored at 0)
//   2. Draw expenses (fixed + variable, variable shocked by 10%)
//   3. Apply investment returns (reserve without noise, risk floored at 0)
//   4. Apply the operating result through the liquidation cascade
//
// If total cash reaches zero at month index m the run stops: months_to_zero = m + 1,
// survived = m >= protected_months and the trajectory is zero-padded.
// Single-run survival_probability is 0.0 when not survived, m / horizon when
// the run hit zero after the protected window, and 1.0 when it never hit zero.
SimulationResult simulate(
    const ParameterSet& params,
    const AllocationStrategy& allocation,
    ScenarioKind scenario,
    RandomEngine& rng,
    const SimulationOptions& options = SimulationOptions()
);

} // namespace cashalloc

#endif // CASHALLOC_SCENARIO_HPP
