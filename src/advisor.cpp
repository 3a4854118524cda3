#include "advisor.hpp"
#include <algorithm>
#include <cmath>

namespace cashalloc {

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // anonymous namespace

double minimum_reserve(const ParameterSet& params) {
    double bad_expenses = params.total_expenses() * 1.2;
    double bad_cash = std::max(0.0,
        params.expected_monthly_cash() * (1.0 - 2.0 * params.cash_volatility()));

    double monthly_deficit = std::max(0.0, bad_expenses - bad_cash);
    return monthly_deficit * static_cast<double>(params.protected_months());
}

AllocationStrategy suggest(const ParameterSet& params) {
    double reserve_needed = minimum_reserve(params);

    double reserve_pct;
    if (params.cash_on_hand() > 0.0) {
        reserve_pct = std::min(reserve_needed / params.cash_on_hand() * 100.0, 100.0);
    } else {
        // No capital to split: everything is reserve if there is any deficit
        reserve_pct = reserve_needed > 0.0 ? 100.0 : 0.0;
    }

    double remaining = 100.0 - reserve_pct;
    double risk_pct = remaining * params.risk_tolerance() * MAX_RISK_SHARE;

    // Growth takes the rounded remainder so the rounded parts still sum to 100
    double reserve_rounded = round2(reserve_pct);
    double risk_rounded = round2(risk_pct);
    double growth_rounded = round2(100.0 - reserve_rounded - risk_rounded);

    return AllocationStrategy(reserve_rounded, growth_rounded, risk_rounded);
}

} // namespace cashalloc
