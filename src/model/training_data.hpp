#ifndef CASHALLOC_MODEL_TRAINING_DATA_HPP
#define CASHALLOC_MODEL_TRAINING_DATA_HPP

#include "features.hpp"
#include "../evaluation.hpp"
#include "../scenario.hpp"
#include <array>
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace cashalloc {

constexpr size_t NUM_TARGETS = 5;

// Column names of the targets, after the feature columns
extern const std::array<const char*, NUM_TARGETS> TARGET_NAMES;

// One synthetic sample: derived features against advisor allocation and
// single-run evaluation result
struct TrainingSample {
    FeatureVector features;
    double reserve_pct;
    double growth_pct;
    double risk_pct;
    double valid;                      // 1.0 or 0.0
    double bad_survival_probability;

    bool operator==(const TrainingSample& other) const;
};

// Uniform sampling ranges for synthetic parameter sets
struct TrainingDataRanges {
    double cash_min, cash_max;
    double monthly_cash_min, monthly_cash_max;
    double fixed_min, fixed_max;
    double variable_min, variable_max;
    double volatility_min, volatility_max;
    double tolerance_min, tolerance_max;
    int protected_min, protected_max;      // Inclusive

    TrainingDataRanges();
};

// TrainingDataset: rows of the 14-column interchange table
class TrainingDataset {
public:
    TrainingDataset();

    void add(const TrainingSample& sample);
    const TrainingSample& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<TrainingSample>& samples() const { return samples_; }

    void reserve(size_t count);
    void clear();

    // Column views used for fitting
    std::vector<FeatureVector> features() const;
    std::vector<double> reserve_targets() const;
    std::vector<double> growth_targets() const;
    std::vector<double> risk_targets() const;

    // CSV with a header row: 9 feature columns then 5 target columns
    void save_csv(const std::string& filepath) const;
    void save_csv(std::ostream& os) const;
    static TrainingDataset load_csv(const std::string& filepath);
    static TrainingDataset load_csv(std::istream& is);

    // Parquet with the same columns (requires Apache Arrow)
    void save_parquet(const std::string& filepath) const;
    static TrainingDataset load_parquet(const std::string& filepath);

    // Dispatch on extension: ".parquet" or CSV otherwise
    void save(const std::string& filepath) const;
    static TrainingDataset load(const std::string& filepath);

    // Header row in column order
    static std::vector<std::string> column_names();

private:
    std::vector<TrainingSample> samples_;
};

// Draw n_samples random parameter sets, run the advisor and a single-run
// evaluation (no Monte Carlo) on each, and record features against targets.
// Progress is logged every 1000 samples.
TrainingDataset generate_training_data(
    size_t n_samples,
    RandomEngine& rng,
    const TrainingDataRanges& ranges = TrainingDataRanges(),
    const EvaluationConfig& config = EvaluationConfig()
);

} // namespace cashalloc

#endif // CASHALLOC_MODEL_TRAINING_DATA_HPP
