#include "scenario.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace cashalloc {

// ============================================================================
// ScenarioKind Implementation
// ============================================================================

std::string scenario_name(ScenarioKind kind) {
    switch (kind) {
        case ScenarioKind::Good: return "good";
        case ScenarioKind::Neutral: return "neutral";
        case ScenarioKind::Bad: return "bad";
    }
    return "unknown";
}

ScenarioKind parse_scenario_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "good") return ScenarioKind::Good;
    if (lower == "neutral") return ScenarioKind::Neutral;
    if (lower == "bad") return ScenarioKind::Bad;
    throw std::invalid_argument("Unknown scenario kind: " + name);
}

ScenarioMultipliers scenario_multipliers(ScenarioKind kind, double cash_volatility) {
    switch (kind) {
        case ScenarioKind::Good:
            return ScenarioMultipliers{1.0 + cash_volatility, 0.9, 1.2};
        case ScenarioKind::Neutral:
            return ScenarioMultipliers{1.0, 1.0, 1.0};
        case ScenarioKind::Bad:
            return ScenarioMultipliers{1.0 - 2.0 * cash_volatility, 1.2, 0.5};
    }
    throw std::invalid_argument("Unknown scenario kind");
}

// ============================================================================
// Liquidation Cascade
// ============================================================================

void apply_operating_result(TierBalances& tiers, double operating_result) {
    if (operating_result >= 0.0) {
        tiers.reserve += operating_result;
        return;
    }

    tiers.reserve += operating_result;
    if (tiers.reserve < 0.0) {
        // Liquidate growth to cover the reserve deficit
        tiers.growth += tiers.reserve;
        tiers.reserve = 0.0;
        if (tiers.growth < 0.0) {
            // Liquidate risk as a last resort
            tiers.risk += tiers.growth;
            tiers.growth = 0.0;
            if (tiers.risk < 0.0) {
                tiers.risk = 0.0;
            }
        }
    }
}

// ============================================================================
// SimulationOptions / SimulationResult Implementation
// ============================================================================

SimulationOptions::SimulationOptions()
    : apply_noise(true), record_tiers(false) {}

SimulationResult::SimulationResult()
    : scenario(ScenarioKind::Neutral),
      survived(true),
      months_to_zero(std::numeric_limits<double>::infinity()),
      survival_probability(1.0) {}

bool SimulationResult::hit_zero() const {
    return std::isfinite(months_to_zero);
}

double SimulationResult::final_cash() const {
    return trajectory.empty() ? 0.0 : trajectory.back();
}

// ============================================================================
// Simulation Implementation
// ============================================================================

SimulationResult simulate(
    const ParameterSet& params,
    const AllocationStrategy& allocation,
    ScenarioKind scenario,
    RandomEngine& rng,
    const SimulationOptions& options)
{
    const ScenarioMultipliers mult = scenario_multipliers(scenario, params.cash_volatility());
    const InvestmentOpportunities& inv = params.investments();
    const int horizon = params.simulation_horizon();
    const size_t trajectory_length = static_cast<size_t>(horizon) + 1;

    // Shocks are sigma * Z so that a zero sigma is valid
    std::normal_distribution<double> normal(0.0, 1.0);
    auto shock = [&](double sigma) {
        return options.apply_noise ? sigma * normal(rng) : 0.0;
    };

    TierAmounts initial = allocation.amounts(params.cash_on_hand());
    TierBalances tiers{initial.reserve, initial.growth, initial.risk};

    SimulationResult result;
    result.scenario = scenario;
    result.trajectory.reserve(trajectory_length);
    result.trajectory.push_back(tiers.total());
    if (options.record_tiers) {
        result.tiers.reserve(trajectory_length);
        result.tiers.push_back(tiers);
    }

    for (int month = 0; month < horizon; ++month) {
        // --- Operating cash flow ---

        double monthly_cash = params.expected_monthly_cash() * mult.cash;
        monthly_cash += shock(params.cash_volatility() * monthly_cash);
        monthly_cash = std::max(0.0, monthly_cash);

        double fixed = params.fixed_expenses() * mult.expense;
        double variable = params.variable_expenses() * mult.expense;
        variable += shock(variable * 0.1);
        double operating_result = monthly_cash - (fixed + variable);

        // --- Investment returns ---

        double growth_return = tiers.growth * (
            inv.medium_return * mult.ret + shock(inv.medium_volatility));
        double risk_return = tiers.risk * (
            inv.high_return * mult.ret + shock(inv.high_volatility));
        double reserve_return = tiers.reserve * inv.safe_return * mult.ret;

        tiers.growth += growth_return;
        tiers.risk = std::max(0.0, tiers.risk + risk_return);
        tiers.reserve += reserve_return;

        apply_operating_result(tiers, operating_result);

        double total = tiers.total();
        result.trajectory.push_back(total);
        if (options.record_tiers) {
            result.tiers.push_back(tiers);
        }

        if (total <= 0.0) {
            result.months_to_zero = static_cast<double>(month + 1);
            result.survived = month >= params.protected_months();
            result.survival_probability = result.survived
                ? static_cast<double>(month) / static_cast<double>(horizon)
                : 0.0;

            result.trajectory.resize(trajectory_length, 0.0);
            if (options.record_tiers) {
                result.tiers.resize(trajectory_length, TierBalances{0.0, 0.0, 0.0});
            }
            return result;
        }
    }

    result.survived = true;
    result.months_to_zero = std::numeric_limits<double>::infinity();
    result.survival_probability = 1.0;
    return result;
}

} // namespace cashalloc
