#ifndef CASHALLOC_PARAMETERS_HPP
#define CASHALLOC_PARAMETERS_HPP

#include <array>
#include <stdexcept>
#include <string>

namespace cashalloc {

// Thrown when a value object is constructed from inputs that break its invariants
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Expected monthly return and return volatility of the three investment tiers
struct InvestmentOpportunities {
    double safe_return;          // Reserve tier (e.g. 0.009 = 0.9% per month)
    double medium_return;        // Growth tier
    double high_return;          // Risk tier
    double safe_volatility;
    double medium_volatility;
    double high_volatility;

    InvestmentOpportunities();
    InvestmentOpportunities(double safe, double medium, double high,
                            double safe_vol, double medium_vol, double high_vol);
};

// ParameterSet: financial state and risk profile of one firm.
// Validated on construction and never mutated afterwards.
class ParameterSet {
public:
    ParameterSet(double cash_on_hand,
                 double expected_monthly_cash,
                 double fixed_expenses,
                 double variable_expenses,
                 double cash_volatility,
                 double risk_tolerance,
                 int protected_months,
                 const InvestmentOpportunities& investments = InvestmentOpportunities());

    double cash_on_hand() const { return cash_on_hand_; }
    double expected_monthly_cash() const { return expected_monthly_cash_; }
    double fixed_expenses() const { return fixed_expenses_; }
    double variable_expenses() const { return variable_expenses_; }
    double cash_volatility() const { return cash_volatility_; }
    double risk_tolerance() const { return risk_tolerance_; }
    int protected_months() const { return protected_months_; }
    const InvestmentOpportunities& investments() const { return investments_; }

    double total_expenses() const { return fixed_expenses_ + variable_expenses_; }

    // Simulation runs twelve months beyond the protected window
    int simulation_horizon() const { return protected_months_ + 12; }

private:
    double cash_on_hand_;
    double expected_monthly_cash_;
    double fixed_expenses_;
    double variable_expenses_;
    double cash_volatility_;
    double risk_tolerance_;
    int protected_months_;
    InvestmentOpportunities investments_;
};

// Absolute monetary split of the cash on hand
struct TierAmounts {
    double reserve;
    double growth;
    double risk;

    double total() const { return reserve + growth + risk; }
};

// AllocationStrategy: percentage split across reserve, growth and risk tiers.
// The three values must sum to 100 (within SUM_TOLERANCE).
class AllocationStrategy {
public:
    static constexpr double SUM_TOLERANCE = 0.01;

    AllocationStrategy(double reserve_pct, double growth_pct, double risk_pct);

    double reserve_pct() const { return reserve_pct_; }
    double growth_pct() const { return growth_pct_; }
    double risk_pct() const { return risk_pct_; }

    // Monetary value of each tier for a given total
    TierAmounts amounts(double total) const;

    bool operator==(const AllocationStrategy& other) const;
    bool operator!=(const AllocationStrategy& other) const { return !(*this == other); }

private:
    double reserve_pct_;
    double growth_pct_;
    double risk_pct_;
};

} // namespace cashalloc

#endif // CASHALLOC_PARAMETERS_HPP
