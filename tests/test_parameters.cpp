#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>
#include "parameters.hpp"

using namespace cashalloc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// ParameterSet Tests
// ============================================================================

TEST_CASE("ParameterSet stores its inputs", "[parameters]") {
    ParameterSet params(100000.0, 15000.0, 8000.0, 3000.0, 0.15, 0.3, 6);

    REQUIRE(params.cash_on_hand() == 100000.0);
    REQUIRE(params.expected_monthly_cash() == 15000.0);
    REQUIRE(params.fixed_expenses() == 8000.0);
    REQUIRE(params.variable_expenses() == 3000.0);
    REQUIRE(params.cash_volatility() == 0.15);
    REQUIRE(params.risk_tolerance() == 0.3);
    REQUIRE(params.protected_months() == 6);
    REQUIRE(params.total_expenses() == 11000.0);
    REQUIRE(params.simulation_horizon() == 18);
}

TEST_CASE("InvestmentOpportunities defaults", "[parameters]") {
    InvestmentOpportunities inv;

    REQUIRE_THAT(inv.safe_return, WithinRel(0.009, 1e-12));
    REQUIRE_THAT(inv.medium_return, WithinRel(0.01, 1e-12));
    REQUIRE_THAT(inv.high_return, WithinRel(0.05, 1e-12));
    REQUIRE_THAT(inv.safe_volatility, WithinRel(0.001, 1e-12));
    REQUIRE_THAT(inv.medium_volatility, WithinRel(0.05, 1e-12));
    REQUIRE_THAT(inv.high_volatility, WithinRel(0.15, 1e-12));
}

TEST_CASE("ParameterSet rejects invalid inputs", "[parameters][error]") {
    SECTION("Negative amounts") {
        REQUIRE_THROWS_AS(ParameterSet(-1.0, 15000.0, 8000.0, 3000.0, 0.15, 0.3, 6), ValidationError);
        REQUIRE_THROWS_AS(ParameterSet(1000.0, -1.0, 8000.0, 3000.0, 0.15, 0.3, 6), ValidationError);
        REQUIRE_THROWS_AS(ParameterSet(1000.0, 15000.0, -8000.0, 3000.0, 0.15, 0.3, 6), ValidationError);
        REQUIRE_THROWS_AS(ParameterSet(1000.0, 15000.0, 8000.0, -3000.0, 0.15, 0.3, 6), ValidationError);
    }

    SECTION("Fractions outside [0, 1]") {
        REQUIRE_THROWS_AS(ParameterSet(1000.0, 15000.0, 8000.0, 3000.0, 1.5, 0.3, 6), ValidationError);
        REQUIRE_THROWS_AS(ParameterSet(1000.0, 15000.0, 8000.0, 3000.0, 0.15, -0.1, 6), ValidationError);
    }

    SECTION("Non-finite values") {
        double nan = std::numeric_limits<double>::quiet_NaN();
        double inf = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(ParameterSet(nan, 15000.0, 8000.0, 3000.0, 0.15, 0.3, 6), ValidationError);
        REQUIRE_THROWS_AS(ParameterSet(inf, 15000.0, 8000.0, 3000.0, 0.15, 0.3, 6), ValidationError);
    }

    SECTION("Zero protected months") {
        REQUIRE_THROWS_AS(ParameterSet(1000.0, 15000.0, 8000.0, 3000.0, 0.15, 0.3, 0), ValidationError);
        REQUIRE_THROWS_AS(ParameterSet(1000.0, 15000.0, 8000.0, 3000.0, 0.15, 0.3, -2), ValidationError);
    }

    SECTION("Negative investment return") {
        InvestmentOpportunities inv;
        inv.high_return = -0.05;
        REQUIRE_THROWS_AS(ParameterSet(1000.0, 15000.0, 8000.0, 3000.0, 0.15, 0.3, 6, inv), ValidationError);
    }
}

TEST_CASE("ParameterSet accepts boundary values", "[parameters][boundary]") {
    REQUIRE_NOTHROW(ParameterSet(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 1));
    REQUIRE_NOTHROW(ParameterSet(1000.0, 1000.0, 500.0, 0.0, 1.0, 1.0, 1));
}

TEST_CASE("ValidationError is an invalid_argument", "[parameters][error]") {
    REQUIRE_THROWS_AS(ParameterSet(-1.0, 0.0, 0.0, 0.0, 0.0, 0.0, 1), std::invalid_argument);
}

// ============================================================================
// AllocationStrategy Tests
// ============================================================================

TEST_CASE("AllocationStrategy accepts sums within tolerance", "[allocation]") {
    REQUIRE_NOTHROW(AllocationStrategy(20.0, 60.0, 20.0));
    REQUIRE_NOTHROW(AllocationStrategy(33.335, 33.33, 33.33));  // 99.995
    REQUIRE_NOTHROW(AllocationStrategy(100.0, 0.0, 0.0));
    REQUIRE_NOTHROW(AllocationStrategy(0.0, 0.0, 100.0));
}

TEST_CASE("AllocationStrategy rejects sums outside tolerance", "[allocation][error]") {
    REQUIRE_THROWS_AS(AllocationStrategy(20.0, 60.0, 30.0), ValidationError);
    REQUIRE_THROWS_AS(AllocationStrategy(33.0, 33.0, 33.0), ValidationError);
    REQUIRE_THROWS_AS(AllocationStrategy(0.0, 0.0, 0.0), ValidationError);

    double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(AllocationStrategy(nan, 50.0, 50.0), ValidationError);
}

TEST_CASE("AllocationStrategy amounts split the total", "[allocation]") {
    AllocationStrategy allocation(20.0, 50.0, 30.0);
    TierAmounts amounts = allocation.amounts(200000.0);

    REQUIRE_THAT(amounts.reserve, WithinRel(40000.0, 1e-12));
    REQUIRE_THAT(amounts.growth, WithinRel(100000.0, 1e-12));
    REQUIRE_THAT(amounts.risk, WithinRel(60000.0, 1e-12));
    REQUIRE_THAT(amounts.total(), WithinRel(200000.0, 1e-12));
}

TEST_CASE("AllocationStrategy equality", "[allocation]") {
    REQUIRE(AllocationStrategy(20.0, 60.0, 20.0) == AllocationStrategy(20.0, 60.0, 20.0));
    REQUIRE(AllocationStrategy(20.0, 60.0, 20.0) != AllocationStrategy(30.0, 50.0, 20.0));
}
