#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "advisor.hpp"
#include "scenario.hpp"

using namespace cashalloc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

InvestmentOpportunities no_returns() {
    return InvestmentOpportunities(0.0, 0.0, 0.0, 0.0, 0.0, 0.0);
}

SimulationOptions noise_free() {
    SimulationOptions options;
    options.apply_noise = false;
    options.record_tiers = true;
    return options;
}

} // anonymous namespace

// ============================================================================
// ScenarioKind Tests
// ============================================================================

TEST_CASE("Scenario multipliers follow the policy table", "[scenario]") {
    ScenarioMultipliers good = scenario_multipliers(ScenarioKind::Good, 0.2);
    REQUIRE_THAT(good.cash, WithinRel(1.2, 1e-12));
    REQUIRE_THAT(good.expense, WithinRel(0.9, 1e-12));
    REQUIRE_THAT(good.ret, WithinRel(1.2, 1e-12));

    ScenarioMultipliers neutral = scenario_multipliers(ScenarioKind::Neutral, 0.2);
    REQUIRE(neutral.cash == 1.0);
    REQUIRE(neutral.expense == 1.0);
    REQUIRE(neutral.ret == 1.0);

    ScenarioMultipliers bad = scenario_multipliers(ScenarioKind::Bad, 0.2);
    REQUIRE_THAT(bad.cash, WithinRel(0.6, 1e-12));
    REQUIRE_THAT(bad.expense, WithinRel(1.2, 1e-12));
    REQUIRE_THAT(bad.ret, WithinRel(0.5, 1e-12));
}

TEST_CASE("Scenario names parse case-insensitively", "[scenario]") {
    REQUIRE(parse_scenario_kind("good") == ScenarioKind::Good);
    REQUIRE(parse_scenario_kind("Neutral") == ScenarioKind::Neutral);
    REQUIRE(parse_scenario_kind("BAD") == ScenarioKind::Bad);
    REQUIRE_THROWS_AS(parse_scenario_kind("awful"), std::invalid_argument);
    // Bytes outside ASCII are rejected, not folded
    REQUIRE_THROWS_AS(parse_scenario_kind("b\xC3\xA4" "d"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_scenario_kind("\xFFgood"), std::invalid_argument);

    for (ScenarioKind kind : ALL_SCENARIOS) {
        REQUIRE(parse_scenario_kind(scenario_name(kind)) == kind);
    }
}

// ============================================================================
// Liquidation Cascade Tests
// ============================================================================

TEST_CASE("Surplus is added to the reserve", "[scenario][cascade]") {
    TierBalances tiers{100.0, 200.0, 300.0};
    apply_operating_result(tiers, 50.0);

    REQUIRE(tiers.reserve == 150.0);
    REQUIRE(tiers.growth == 200.0);
    REQUIRE(tiers.risk == 300.0);
}

TEST_CASE("Shortfall drains reserve, then growth, then risk", "[scenario][cascade]") {
    SECTION("Covered by reserve") {
        TierBalances tiers{100.0, 200.0, 300.0};
        apply_operating_result(tiers, -60.0);
        REQUIRE(tiers.reserve == 40.0);
        REQUIRE(tiers.growth == 200.0);
        REQUIRE(tiers.risk == 300.0);
    }

    SECTION("Spills into growth") {
        TierBalances tiers{100.0, 200.0, 300.0};
        apply_operating_result(tiers, -150.0);
        REQUIRE(tiers.reserve == 0.0);
        REQUIRE(tiers.growth == 150.0);
        REQUIRE(tiers.risk == 300.0);
    }

    SECTION("Spills into risk") {
        TierBalances tiers{100.0, 200.0, 300.0};
        apply_operating_result(tiers, -400.0);
        REQUIRE(tiers.reserve == 0.0);
        REQUIRE(tiers.growth == 0.0);
        REQUIRE(tiers.risk == 200.0);
    }

    SECTION("Shortfall beyond all capital is clamped") {
        TierBalances tiers{100.0, 200.0, 300.0};
        apply_operating_result(tiers, -1000.0);
        REQUIRE(tiers.reserve == 0.0);
        REQUIRE(tiers.growth == 0.0);
        REQUIRE(tiers.risk == 0.0);
        REQUIRE(tiers.total() == 0.0);
    }
}

// ============================================================================
// Simulation Tests
// ============================================================================

TEST_CASE("Noise-free cascade drains tiers in order", "[scenario][simulate]") {
    ParameterSet params(1000.0, 0.0, 250.0, 0.0, 0.0, 0.0, 1, no_returns());
    AllocationStrategy allocation(10.0, 60.0, 30.0);
    RandomEngine rng(1);

    SimulationResult result = simulate(params, allocation, ScenarioKind::Neutral, rng, noise_free());

    REQUIRE(result.trajectory.size() == 14);   // horizon 13 + 1
    REQUIRE_THAT(result.trajectory[0], WithinAbs(1000.0, 1e-9));
    REQUIRE_THAT(result.trajectory[1], WithinAbs(750.0, 1e-9));
    REQUIRE_THAT(result.trajectory[2], WithinAbs(500.0, 1e-9));
    REQUIRE_THAT(result.trajectory[3], WithinAbs(250.0, 1e-9));
    REQUIRE(result.trajectory[4] == 0.0);
    for (size_t i = 5; i < result.trajectory.size(); ++i) {
        REQUIRE(result.trajectory[i] == 0.0);
    }

    // Month 1: reserve 100 gone, growth covers 150
    REQUIRE(result.tiers[1].reserve == 0.0);
    REQUIRE_THAT(result.tiers[1].growth, WithinAbs(450.0, 1e-9));
    REQUIRE_THAT(result.tiers[1].risk, WithinAbs(300.0, 1e-9));
    // Month 3: growth exhausted, risk covers the rest
    REQUIRE(result.tiers[3].growth == 0.0);
    REQUIRE_THAT(result.tiers[3].risk, WithinAbs(250.0, 1e-9));

    REQUIRE(result.months_to_zero == 4.0);
    REQUIRE(result.hit_zero());
    REQUIRE(result.survived);
    REQUIRE_THAT(result.survival_probability, WithinRel(3.0 / 13.0, 1e-12));
}

TEST_CASE("Hitting zero inside the protected window fails the run", "[scenario][simulate]") {
    ParameterSet params(1000.0, 0.0, 500.0, 0.0, 0.2, 0.3, 6);
    AllocationStrategy allocation(100.0, 0.0, 0.0);
    RandomEngine rng(7);

    SimulationResult result = simulate(params, allocation, ScenarioKind::Bad, rng);

    REQUIRE(result.months_to_zero == 2.0);
    REQUIRE_FALSE(result.survived);
    REQUIRE(result.survival_probability == 0.0);
    REQUIRE(result.trajectory.size() == 19);
    REQUIRE(result.final_cash() == 0.0);
}

TEST_CASE("Noise-free bad case of the reference firm survives", "[scenario][simulate]") {
    ParameterSet params(100000.0, 15000.0, 8000.0, 3000.0, 0.15, 0.3, 6);
    AllocationStrategy allocation = suggest(params);
    RandomEngine rng(3);

    SimulationResult result = simulate(params, allocation, ScenarioKind::Bad, rng, noise_free());

    REQUIRE(result.survived);
    REQUIRE_FALSE(result.hit_zero());
    REQUIRE(std::isinf(result.months_to_zero));
    REQUIRE(result.survival_probability == 1.0);
    REQUIRE(result.trajectory.size() == 19);
    REQUIRE(result.tiers.size() == 19);

    // Month 1: revenue 10500, expenses 13200, reserve return at half rate
    REQUIRE_THAT(result.tiers[1].reserve, WithinRel(13572.9, 1e-9));
    REQUIRE_THAT(result.tiers[1].growth, WithinRel(76641.3, 1e-9));
    REQUIRE_THAT(result.tiers[1].risk, WithinRel(7728.5, 1e-9));
    REQUIRE_THAT(result.trajectory[1], WithinRel(97942.7, 1e-9));

    // The reserve alone carries every protected month
    for (int month = 1; month <= params.protected_months(); ++month) {
        REQUIRE(result.tiers[static_cast<size_t>(month)].reserve > 0.0);
    }
    REQUIRE_THAT(result.tiers[6].reserve, WithinAbs(259.0, 0.01));
    REQUIRE(result.tiers[7].reserve == 0.0);
}

TEST_CASE("Zero volatility is tolerated", "[scenario][simulate][boundary]") {
    ParameterSet params(50000.0, 10000.0, 6000.0, 2000.0, 0.0, 0.5, 3);
    AllocationStrategy allocation(30.0, 50.0, 20.0);
    RandomEngine rng(11);

    for (ScenarioKind kind : ALL_SCENARIOS) {
        SimulationResult result;
        REQUIRE_NOTHROW(result = simulate(params, allocation, kind, rng));
        REQUIRE(result.trajectory.size() == 16);
        REQUIRE(result.scenario == kind);
    }
}

TEST_CASE("Simulation is reproducible for a given seed", "[scenario][simulate]") {
    ParameterSet params(30000.0, 10000.0, 8000.0, 3000.0, 0.2, 0.3, 6);
    AllocationStrategy allocation(20.0, 60.0, 20.0);

    RandomEngine rng_a(2024);
    RandomEngine rng_b(2024);
    SimulationResult a = simulate(params, allocation, ScenarioKind::Bad, rng_a);
    SimulationResult b = simulate(params, allocation, ScenarioKind::Bad, rng_b);

    REQUIRE(a.trajectory == b.trajectory);
    REQUIRE(a.survived == b.survived);
}

TEST_CASE("Trajectory never goes negative", "[scenario][simulate]") {
    ParameterSet params(5000.0, 2000.0, 4000.0, 2000.0, 0.4, 0.9, 3);
    AllocationStrategy allocation(10.0, 30.0, 60.0);
    RandomEngine rng(99);

    for (int i = 0; i < 50; ++i) {
        SimulationResult result = simulate(params, allocation, ScenarioKind::Bad, rng);
        for (double cash : result.trajectory) {
            REQUIRE(cash >= 0.0);
        }
    }
}
