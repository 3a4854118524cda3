#include "parameters.hpp"
#include <cmath>
#include <sstream>

namespace cashalloc {

// ============================================================================
// InvestmentOpportunities Implementation
// ============================================================================

InvestmentOpportunities::InvestmentOpportunities()
    : safe_return(0.009), medium_return(0.01), high_return(0.05),
      safe_volatility(0.001), medium_volatility(0.05), high_volatility(0.15) {}

InvestmentOpportunities::InvestmentOpportunities(
    double safe, double medium, double high,
    double safe_vol, double medium_vol, double high_vol)
    : safe_return(safe), medium_return(medium), high_return(high),
      safe_volatility(safe_vol), medium_volatility(medium_vol), high_volatility(high_vol) {}

// ============================================================================
// ParameterSet Implementation
// ============================================================================

namespace {

void require_non_negative(const char* name, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        std::ostringstream oss;
        oss << name << " must be a non-negative finite number, got " << value;
        throw ValidationError(oss.str());
    }
}

void require_unit_interval(const char* name, double value) {
    require_non_negative(name, value);
    if (value > 1.0) {
        std::ostringstream oss;
        oss << name << " must be between 0 and 1, got " << value;
        throw ValidationError(oss.str());
    }
}

} // anonymous namespace

ParameterSet::ParameterSet(double cash_on_hand,
                           double expected_monthly_cash,
                           double fixed_expenses,
                           double variable_expenses,
                           double cash_volatility,
                           double risk_tolerance,
                           int protected_months,
                           const InvestmentOpportunities& investments)
    : cash_on_hand_(cash_on_hand),
      expected_monthly_cash_(expected_monthly_cash),
      fixed_expenses_(fixed_expenses),
      variable_expenses_(variable_expenses),
      cash_volatility_(cash_volatility),
      risk_tolerance_(risk_tolerance),
      protected_months_(protected_months),
      investments_(investments)
{
    require_non_negative("cash_on_hand", cash_on_hand_);
    require_non_negative("expected_monthly_cash", expected_monthly_cash_);
    require_non_negative("fixed_expenses", fixed_expenses_);
    require_non_negative("variable_expenses", variable_expenses_);
    require_unit_interval("cash_volatility", cash_volatility_);
    require_unit_interval("risk_tolerance", risk_tolerance_);

    if (protected_months_ < 1) {
        throw ValidationError("protected_months must be at least 1, got " +
                              std::to_string(protected_months_));
    }

    require_non_negative("safe_return", investments_.safe_return);
    require_non_negative("medium_return", investments_.medium_return);
    require_non_negative("high_return", investments_.high_return);
    require_non_negative("safe_volatility", investments_.safe_volatility);
    require_non_negative("medium_volatility", investments_.medium_volatility);
    require_non_negative("high_volatility", investments_.high_volatility);
}

// ============================================================================
// AllocationStrategy Implementation
// ============================================================================

AllocationStrategy::AllocationStrategy(double reserve_pct, double growth_pct, double risk_pct)
    : reserve_pct_(reserve_pct), growth_pct_(growth_pct), risk_pct_(risk_pct)
{
    double total = reserve_pct_ + growth_pct_ + risk_pct_;
    // NaN fails this comparison as well
    if (!(std::fabs(total - 100.0) <= SUM_TOLERANCE)) {
        std::ostringstream oss;
        oss << "Allocation must sum to 100%, got " << total << "% ("
            << reserve_pct_ << " + " << growth_pct_ << " + " << risk_pct_ << ")";
        throw ValidationError(oss.str());
    }
}

TierAmounts AllocationStrategy::amounts(double total) const {
    TierAmounts result;
    result.reserve = total * (reserve_pct_ / 100.0);
    result.growth = total * (growth_pct_ / 100.0);
    result.risk = total * (risk_pct_ / 100.0);
    return result;
}

bool AllocationStrategy::operator==(const AllocationStrategy& other) const {
    return reserve_pct_ == other.reserve_pct_ &&
           growth_pct_ == other.growth_pct_ &&
           risk_pct_ == other.risk_pct_;
}

} // namespace cashalloc
