#ifndef CASHALLOC_MODEL_FEATURES_HPP
#define CASHALLOC_MODEL_FEATURES_HPP

#include "../parameters.hpp"
#include <array>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cashalloc {

constexpr size_t NUM_FEATURES = 9;

using FeatureVector = std::array<double, NUM_FEATURES>;

// Column names, in feature order
extern const std::array<const char*, NUM_FEATURES> FEATURE_NAMES;

// Raw parameters plus two derived ratios:
//   slack_ratio    = expected_monthly_cash / total_expenses
//   reserve_months = cash_on_hand / total_expenses
// Throws ValidationError when total expenses are zero.
FeatureVector derive_features(const ParameterSet& params);

// Per-feature standardization: (x - mean) / scale.
// Scale is the population standard deviation, or 1 for a constant feature.
class FeatureScaler {
public:
    FeatureScaler();

    void fit(const std::vector<FeatureVector>& samples);
    FeatureVector transform(const FeatureVector& features) const;
    std::vector<FeatureVector> transform(const std::vector<FeatureVector>& samples) const;

    bool is_fitted() const { return fitted_; }
    const FeatureVector& mean() const { return mean_; }
    const FeatureVector& scale() const { return scale_; }

    nlohmann::json to_json() const;
    static FeatureScaler from_json(const nlohmann::json& j);

private:
    bool fitted_;
    FeatureVector mean_;
    FeatureVector scale_;
};

} // namespace cashalloc

#endif // CASHALLOC_MODEL_FEATURES_HPP
