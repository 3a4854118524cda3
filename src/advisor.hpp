#ifndef CASHALLOC_ADVISOR_HPP
#define CASHALLOC_ADVISOR_HPP

#include "parameters.hpp"

namespace cashalloc {

// Share of the non-reserve remainder that full risk tolerance may claim
constexpr double MAX_RISK_SHARE = 0.3;

// Reserve needed to cover the bad-case monthly deficit for every protected month.
// Bad case: expenses x1.2, revenue x(1 - 2*volatility) floored at zero.
double minimum_reserve(const ParameterSet& params);

// Closed-form starting allocation, no simulation and no randomness.
// Reserve covers minimum_reserve() (capped at 100%), risk takes
// remainder * risk_tolerance * 0.3 and growth takes the rest.
// Percentages are rounded to two decimals and still sum to 100.
AllocationStrategy suggest(const ParameterSet& params);

} // namespace cashalloc

#endif // CASHALLOC_ADVISOR_HPP
