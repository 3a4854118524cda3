#include "training_data.hpp"
#include "../advisor.hpp"
#include "../logger.hpp"
#include "../io/csv_reader.hpp"
#include "../io/parquet_reader.hpp"
#include "../io/parquet_writer.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <stdexcept>

namespace cashalloc {

const std::array<const char*, NUM_TARGETS> TARGET_NAMES = {
    "reserve_pct",
    "growth_pct",
    "risk_pct",
    "valid",
    "bad_survival_probability"
};

bool TrainingSample::operator==(const TrainingSample& other) const {
    return features == other.features &&
           reserve_pct == other.reserve_pct &&
           growth_pct == other.growth_pct &&
           risk_pct == other.risk_pct &&
           valid == other.valid &&
           bad_survival_probability == other.bad_survival_probability;
}

// ============================================================================
// TrainingDataRanges Implementation
// ============================================================================

TrainingDataRanges::TrainingDataRanges()
    : cash_min(10000.0), cash_max(500000.0),
      monthly_cash_min(5000.0), monthly_cash_max(100000.0),
      fixed_min(2000.0), fixed_max(50000.0),
      variable_min(1000.0), variable_max(30000.0),
      volatility_min(0.05), volatility_max(0.40),
      tolerance_min(0.1), tolerance_max(0.9),
      protected_min(3), protected_max(11) {}

// ============================================================================
// TrainingDataset Implementation
// ============================================================================

TrainingDataset::TrainingDataset() = default;

void TrainingDataset::add(const TrainingSample& sample) {
    samples_.push_back(sample);
}

const TrainingSample& TrainingDataset::get(size_t index) const {
    if (index >= samples_.size()) {
        throw std::out_of_range("Training sample index out of range");
    }
    return samples_[index];
}

size_t TrainingDataset::size() const {
    return samples_.size();
}

bool TrainingDataset::empty() const {
    return samples_.empty();
}

void TrainingDataset::reserve(size_t count) {
    samples_.reserve(count);
}

void TrainingDataset::clear() {
    samples_.clear();
}

std::vector<FeatureVector> TrainingDataset::features() const {
    std::vector<FeatureVector> X;
    X.reserve(samples_.size());
    for (const auto& s : samples_) {
        X.push_back(s.features);
    }
    return X;
}

std::vector<double> TrainingDataset::reserve_targets() const {
    std::vector<double> y;
    y.reserve(samples_.size());
    for (const auto& s : samples_) {
        y.push_back(s.reserve_pct);
    }
    return y;
}

std::vector<double> TrainingDataset::growth_targets() const {
    std::vector<double> y;
    y.reserve(samples_.size());
    for (const auto& s : samples_) {
        y.push_back(s.growth_pct);
    }
    return y;
}

std::vector<double> TrainingDataset::risk_targets() const {
    std::vector<double> y;
    y.reserve(samples_.size());
    for (const auto& s : samples_) {
        y.push_back(s.risk_pct);
    }
    return y;
}

std::vector<std::string> TrainingDataset::column_names() {
    std::vector<std::string> names(FEATURE_NAMES.begin(), FEATURE_NAMES.end());
    names.insert(names.end(), TARGET_NAMES.begin(), TARGET_NAMES.end());
    return names;
}

void TrainingDataset::save_csv(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    save_csv(file);
}

void TrainingDataset::save_csv(std::ostream& os) const {
    auto names = column_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) os << ",";
        os << names[i];
    }
    os << "\n";

    // Full precision so a reload reproduces the same doubles
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& s : samples_) {
        for (double f : s.features) {
            os << f << ",";
        }
        os << s.reserve_pct << ","
           << s.growth_pct << ","
           << s.risk_pct << ","
           << s.valid << ","
           << s.bad_survival_probability << "\n";
    }
}

TrainingDataset TrainingDataset::load_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_csv(file);
}

TrainingDataset TrainingDataset::load_csv(std::istream& is) {
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        throw std::runtime_error("Empty CSV file");
    }
    if (header != column_names()) {
        throw std::runtime_error("Training data CSV header does not match the expected 14 columns");
    }

    TrainingDataset dataset;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() != NUM_FEATURES + NUM_TARGETS) {
            throw std::runtime_error("Training data CSV line " + std::to_string(reader.line_number()) +
                                     " has " + std::to_string(row.size()) + " columns");
        }

        TrainingSample sample;
        for (size_t f = 0; f < NUM_FEATURES; ++f) {
            sample.features[f] = std::stod(row[f]);
        }
        sample.reserve_pct = std::stod(row[NUM_FEATURES + 0]);
        sample.growth_pct = std::stod(row[NUM_FEATURES + 1]);
        sample.risk_pct = std::stod(row[NUM_FEATURES + 2]);
        sample.valid = std::stod(row[NUM_FEATURES + 3]);
        sample.bad_survival_probability = std::stod(row[NUM_FEATURES + 4]);
        dataset.add(sample);
    }

    return dataset;
}

void TrainingDataset::save_parquet(const std::string& filepath) const {
    ParquetWriter::write_training_data(*this, filepath);
}

TrainingDataset TrainingDataset::load_parquet(const std::string& filepath) {
    return ParquetReader::load_training_data(filepath);
}

namespace {

bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

} // anonymous namespace

void TrainingDataset::save(const std::string& filepath) const {
    if (ends_with(filepath, ".parquet")) {
        save_parquet(filepath);
    } else {
        save_csv(filepath);
    }
}

TrainingDataset TrainingDataset::load(const std::string& filepath) {
    if (ends_with(filepath, ".parquet")) {
        return load_parquet(filepath);
    }
    return load_csv(filepath);
}

// ============================================================================
// Synthetic Data Generation
// ============================================================================

TrainingDataset generate_training_data(
    size_t n_samples,
    RandomEngine& rng,
    const TrainingDataRanges& ranges,
    const EvaluationConfig& config)
{
    std::uniform_real_distribution<double> cash(ranges.cash_min, ranges.cash_max);
    std::uniform_real_distribution<double> monthly_cash(ranges.monthly_cash_min, ranges.monthly_cash_max);
    std::uniform_real_distribution<double> fixed(ranges.fixed_min, ranges.fixed_max);
    std::uniform_real_distribution<double> variable(ranges.variable_min, ranges.variable_max);
    std::uniform_real_distribution<double> volatility(ranges.volatility_min, ranges.volatility_max);
    std::uniform_real_distribution<double> tolerance(ranges.tolerance_min, ranges.tolerance_max);
    std::uniform_int_distribution<int> protected_months(ranges.protected_min, ranges.protected_max);

    Logger& logger = Logger::get_instance();

    TrainingDataset dataset;
    dataset.reserve(n_samples);

    for (size_t i = 0; i < n_samples; ++i) {
        // Draw in a fixed order so a seeded engine reproduces the dataset
        double c = cash(rng);
        double m = monthly_cash(rng);
        double fx = fixed(rng);
        double var = variable(rng);
        double vol = volatility(rng);
        double tol = tolerance(rng);
        int months = protected_months(rng);
        ParameterSet params(c, m, fx, var, vol, tol, months);

        AllocationStrategy allocation = suggest(params);
        EvaluationOutcome outcome = evaluate(params, allocation, false, rng, config);

        TrainingSample sample;
        sample.features = derive_features(params);
        sample.reserve_pct = allocation.reserve_pct();
        sample.growth_pct = allocation.growth_pct();
        sample.risk_pct = allocation.risk_pct();
        sample.valid = outcome.valid ? 1.0 : 0.0;
        sample.bad_survival_probability = outcome.bad_survival_probability;
        dataset.add(sample);

        if ((i + 1) % 1000 == 0) {
            logger.log_training_progress(i + 1, n_samples);
        }
    }

    return dataset;
}

} // namespace cashalloc
