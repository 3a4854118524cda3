#ifndef CASHALLOC_MODEL_ALLOCATION_MODEL_HPP
#define CASHALLOC_MODEL_ALLOCATION_MODEL_HPP

#include "features.hpp"
#include "random_forest.hpp"
#include "training_data.hpp"
#include "../parameters.hpp"
#include "../scenario.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace cashalloc {

constexpr const char* DEFAULT_MODEL_FOLDER = "models";
constexpr const char* DEFAULT_MODEL_PREFIX = "allocation_model";
constexpr size_t DEFAULT_TRAINING_SAMPLES = 10000;

// Minimum raw predictions before normalization
constexpr double MIN_PREDICTED_RESERVE = 0.1;
constexpr double MIN_PREDICTED_GROWTH = 0.1;
constexpr double MIN_PREDICTED_RISK = 0.0;

/**
 * @brief Thrown when prediction is requested from a model that was never
 * trained or loaded
 */
class NotTrainedError : public std::logic_error {
public:
    explicit NotTrainedError(const std::string& message)
        : std::logic_error(message) {}
};

/**
 * @brief In-sample fit statistics returned by AllocationModel::train
 */
struct TrainingReport {
    size_t samples;
    double r2_reserve;
    double r2_growth;
    double r2_risk;
    double execution_time_ms;

    TrainingReport();
};

/**
 * @brief Learned approximation of the advisor: features -> allocation.
 *
 * Three random-forest regressors (reserve, growth, risk) behind a feature
 * standardizer. Once trained or loaded the model is read-only and can be
 * shared between evaluators.
 */
class AllocationModel {
public:
    AllocationModel();
    explicit AllocationModel(const ForestParams& params);

    /**
     * @brief Fit scaler and regressors on a dataset
     *
     * @throws std::invalid_argument if the dataset is empty
     */
    TrainingReport train(const TrainingDataset& dataset);

    /**
     * @brief Predict an allocation for a parameter set
     *
     * Raw predictions are clamped (reserve, growth >= 0.1; risk >= 0) and
     * normalized to two-decimal percentages; see allocation_from_raw().
     *
     * @throws NotTrainedError if the model is untrained
     * @throws ValidationError if total expenses are zero
     */
    AllocationStrategy predict(const ParameterSet& params) const;

    bool is_trained() const { return trained_; }
    const ForestParams& params() const { return params_; }

    /**
     * @brief Turn raw regressor outputs into a valid allocation
     *
     * Clamps, then normalizes reserve and growth to percent rounded to two
     * decimals, with risk as the remainder. A clamped sum that is not positive and finite yields the
     * conservative 50/30/20 allocation.
     */
    static AllocationStrategy allocation_from_raw(double reserve, double growth, double risk);

    /**
     * @brief Write the four blobs <folder>/<prefix>_{reserve,growth,risk,scaler}.json
     *
     * Creates the folder if needed.
     * @throws NotTrainedError if the model is untrained
     * @throws std::runtime_error if a blob cannot be written
     */
    void save(const std::string& folder = DEFAULT_MODEL_FOLDER,
              const std::string& prefix = DEFAULT_MODEL_PREFIX) const;

    /**
     * @brief Read the four blobs as a unit
     *
     * On any failure the model is left unchanged.
     * @throws std::runtime_error if a blob is missing or malformed
     */
    void load(const std::string& folder = DEFAULT_MODEL_FOLDER,
              const std::string& prefix = DEFAULT_MODEL_PREFIX);

    /**
     * @brief True when all four blobs are present
     */
    static bool blobs_exist(const std::string& folder, const std::string& prefix);

    static std::string blob_path(const std::string& folder, const std::string& prefix,
                                 const std::string& component);

    /**
     * @brief Load the persisted model, or generate data, train and save it
     *
     * A model whose blobs exist but fail to load is retrained (with a
     * warning). When data_path is set an existing dataset there is reused,
     * and a freshly generated one is written there.
     */
    static std::shared_ptr<AllocationModel> load_or_train(
        const std::string& folder,
        const std::string& prefix,
        size_t n_samples,
        RandomEngine& rng,
        const ForestParams& params = ForestParams(),
        const std::string& data_path = ""
    );

private:
    ForestParams params_;
    FeatureScaler scaler_;
    RandomForestRegressor reserve_model_;
    RandomForestRegressor growth_model_;
    RandomForestRegressor risk_model_;
    bool trained_;
};

} // namespace cashalloc

#endif // CASHALLOC_MODEL_ALLOCATION_MODEL_HPP
