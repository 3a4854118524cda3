#include "features.hpp"
#include <cmath>
#include <stdexcept>

namespace cashalloc {

const std::array<const char*, NUM_FEATURES> FEATURE_NAMES = {
    "cash_on_hand",
    "expected_monthly_cash",
    "fixed_expenses",
    "variable_expenses",
    "cash_volatility",
    "risk_tolerance",
    "protected_months",
    "slack_ratio",
    "reserve_months"
};

FeatureVector derive_features(const ParameterSet& params) {
    double total_expenses = params.total_expenses();
    if (total_expenses <= 0.0) {
        throw ValidationError("Cannot derive features: total expenses must be positive");
    }

    return FeatureVector{
        params.cash_on_hand(),
        params.expected_monthly_cash(),
        params.fixed_expenses(),
        params.variable_expenses(),
        params.cash_volatility(),
        params.risk_tolerance(),
        static_cast<double>(params.protected_months()),
        params.expected_monthly_cash() / total_expenses,
        params.cash_on_hand() / total_expenses
    };
}

// ============================================================================
// FeatureScaler Implementation
// ============================================================================

FeatureScaler::FeatureScaler() : fitted_(false) {
    mean_.fill(0.0);
    scale_.fill(1.0);
}

void FeatureScaler::fit(const std::vector<FeatureVector>& samples) {
    if (samples.empty()) {
        throw std::invalid_argument("Cannot fit scaler on an empty sample set");
    }

    const double n = static_cast<double>(samples.size());
    for (size_t f = 0; f < NUM_FEATURES; ++f) {
        double sum = 0.0;
        for (const auto& sample : samples) {
            sum += sample[f];
        }
        double mean = sum / n;

        double sum_sq_diff = 0.0;
        for (const auto& sample : samples) {
            double diff = sample[f] - mean;
            sum_sq_diff += diff * diff;
        }
        double std_dev = std::sqrt(sum_sq_diff / n);

        mean_[f] = mean;
        scale_[f] = std_dev > 0.0 ? std_dev : 1.0;
    }
    fitted_ = true;
}

FeatureVector FeatureScaler::transform(const FeatureVector& features) const {
    if (!fitted_) {
        throw std::logic_error("FeatureScaler used before fit");
    }
    FeatureVector scaled;
    for (size_t f = 0; f < NUM_FEATURES; ++f) {
        scaled[f] = (features[f] - mean_[f]) / scale_[f];
    }
    return scaled;
}

std::vector<FeatureVector> FeatureScaler::transform(const std::vector<FeatureVector>& samples) const {
    std::vector<FeatureVector> scaled;
    scaled.reserve(samples.size());
    for (const auto& sample : samples) {
        scaled.push_back(transform(sample));
    }
    return scaled;
}

nlohmann::json FeatureScaler::to_json() const {
    nlohmann::json j;
    j["type"] = "standard_scaler";
    j["fitted"] = fitted_;
    j["features"] = std::vector<std::string>(FEATURE_NAMES.begin(), FEATURE_NAMES.end());
    j["mean"] = std::vector<double>(mean_.begin(), mean_.end());
    j["scale"] = std::vector<double>(scale_.begin(), scale_.end());
    return j;
}

FeatureScaler FeatureScaler::from_json(const nlohmann::json& j) {
    auto mean = j.at("mean").get<std::vector<double>>();
    auto scale = j.at("scale").get<std::vector<double>>();
    if (mean.size() != NUM_FEATURES || scale.size() != NUM_FEATURES) {
        throw std::runtime_error("Scaler blob has " + std::to_string(mean.size()) +
                                 " features, expected " + std::to_string(NUM_FEATURES));
    }

    FeatureScaler scaler;
    for (size_t f = 0; f < NUM_FEATURES; ++f) {
        if (!(scale[f] > 0.0)) {
            throw std::runtime_error("Scaler blob has non-positive scale for feature " +
                                     std::string(FEATURE_NAMES[f]));
        }
        scaler.mean_[f] = mean[f];
        scaler.scale_[f] = scale[f];
    }
    scaler.fitted_ = j.value("fitted", true);
    return scaler;
}

} // namespace cashalloc
