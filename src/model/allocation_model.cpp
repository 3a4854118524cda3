#include "allocation_model.hpp"
#include "../logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace cashalloc {

namespace {

const char* const BLOB_COMPONENTS[] = {"reserve", "growth", "risk", "scaler"};

void write_blob(const json& blob, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open model blob for writing: " + path);
    }
    file << blob.dump();
    if (!file) {
        throw std::runtime_error("Failed to write model blob: " + path);
    }
}

json read_blob(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Missing model blob: " + path);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed model blob " + path + ": " + e.what());
    }
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // anonymous namespace

TrainingReport::TrainingReport()
    : samples(0), r2_reserve(0.0), r2_growth(0.0), r2_risk(0.0), execution_time_ms(0.0) {}

// ============================================================================
// AllocationModel Implementation
// ============================================================================

AllocationModel::AllocationModel()
    : AllocationModel(ForestParams()) {}

AllocationModel::AllocationModel(const ForestParams& params)
    : params_(params),
      reserve_model_(params),
      growth_model_(params),
      risk_model_(params),
      trained_(false) {}

TrainingReport AllocationModel::train(const TrainingDataset& dataset) {
    if (dataset.empty()) {
        throw std::invalid_argument("Cannot train allocation model on an empty dataset");
    }

    Logger& logger = Logger::get_instance();
    logger.log_training_start(dataset.size(), params_.n_estimators);
    auto start = std::chrono::high_resolution_clock::now();

    FeatureScaler scaler;
    scaler.fit(dataset.features());
    std::vector<FeatureVector> X = scaler.transform(dataset.features());

    std::vector<double> y_reserve = dataset.reserve_targets();
    std::vector<double> y_growth = dataset.growth_targets();
    std::vector<double> y_risk = dataset.risk_targets();

    RandomForestRegressor reserve_model(params_);
    RandomForestRegressor growth_model(params_);
    RandomForestRegressor risk_model(params_);
    reserve_model.fit(X, y_reserve);
    growth_model.fit(X, y_growth);
    risk_model.fit(X, y_risk);

    TrainingReport report;
    report.samples = dataset.size();
    report.r2_reserve = reserve_model.score(X, y_reserve);
    report.r2_growth = growth_model.score(X, y_growth);
    report.r2_risk = risk_model.score(X, y_risk);

    scaler_ = std::move(scaler);
    reserve_model_ = std::move(reserve_model);
    growth_model_ = std::move(growth_model);
    risk_model_ = std::move(risk_model);
    trained_ = true;

    auto end = std::chrono::high_resolution_clock::now();
    report.execution_time_ms = std::chrono::duration<double, std::milli>(end - start).count();

    logger.log_training_complete(report.samples, report.r2_reserve, report.r2_growth,
                                 report.r2_risk, report.execution_time_ms);
    return report;
}

AllocationStrategy AllocationModel::predict(const ParameterSet& params) const {
    if (!trained_) {
        throw NotTrainedError("Allocation model is not trained; call train() or load() first");
    }

    FeatureVector x = scaler_.transform(derive_features(params));
    return allocation_from_raw(reserve_model_.predict(x),
                               growth_model_.predict(x),
                               risk_model_.predict(x));
}

AllocationStrategy AllocationModel::allocation_from_raw(double reserve, double growth, double risk) {
    reserve = std::max(MIN_PREDICTED_RESERVE, reserve);
    growth = std::max(MIN_PREDICTED_GROWTH, growth);
    risk = std::max(MIN_PREDICTED_RISK, risk);

    double total = reserve + growth + risk;
    if (!(total > 0.0) || !std::isfinite(total)) {
        return AllocationStrategy(50.0, 30.0, 20.0);
    }

    double reserve_pct = round2(reserve / total * 100.0);
    double growth_pct = std::min(round2(growth / total * 100.0), 100.0 - reserve_pct);
    // Risk absorbs the rounding so the split sums to 100
    double risk_pct = std::max(0.0, round2(100.0 - reserve_pct - growth_pct));
    return AllocationStrategy(reserve_pct, growth_pct, risk_pct);
}

// ============================================================================
// Persistence
// ============================================================================

std::string AllocationModel::blob_path(const std::string& folder, const std::string& prefix,
                                       const std::string& component) {
    return (fs::path(folder) / (prefix + "_" + component + ".json")).string();
}

bool AllocationModel::blobs_exist(const std::string& folder, const std::string& prefix) {
    for (const char* component : BLOB_COMPONENTS) {
        if (!fs::exists(blob_path(folder, prefix, component))) {
            return false;
        }
    }
    return true;
}

void AllocationModel::save(const std::string& folder, const std::string& prefix) const {
    if (!trained_) {
        throw NotTrainedError("Cannot save an untrained allocation model");
    }

    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
        throw std::runtime_error("Cannot create model folder " + folder + ": " + ec.message());
    }

    write_blob(reserve_model_.to_json(), blob_path(folder, prefix, "reserve"));
    write_blob(growth_model_.to_json(), blob_path(folder, prefix, "growth"));
    write_blob(risk_model_.to_json(), blob_path(folder, prefix, "risk"));
    write_blob(scaler_.to_json(), blob_path(folder, prefix, "scaler"));

    Logger::get_instance().log_model_io("saved", folder, prefix);
}

void AllocationModel::load(const std::string& folder, const std::string& prefix) {
    // Decode everything into locals first so a bad blob leaves *this untouched
    RandomForestRegressor reserve_model;
    RandomForestRegressor growth_model;
    RandomForestRegressor risk_model;
    FeatureScaler scaler;

    try {
        reserve_model = RandomForestRegressor::from_json(read_blob(blob_path(folder, prefix, "reserve")));
        growth_model = RandomForestRegressor::from_json(read_blob(blob_path(folder, prefix, "growth")));
        risk_model = RandomForestRegressor::from_json(read_blob(blob_path(folder, prefix, "risk")));
        scaler = FeatureScaler::from_json(read_blob(blob_path(folder, prefix, "scaler")));
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed model blob in " + folder + ": " + e.what());
    }

    if (!scaler.is_fitted()) {
        throw std::runtime_error("Scaler blob in " + folder + " is not fitted");
    }

    params_ = reserve_model.params();
    scaler_ = std::move(scaler);
    reserve_model_ = std::move(reserve_model);
    growth_model_ = std::move(growth_model);
    risk_model_ = std::move(risk_model);
    trained_ = true;

    Logger::get_instance().log_model_io("loaded", folder, prefix);
}

std::shared_ptr<AllocationModel> AllocationModel::load_or_train(
    const std::string& folder,
    const std::string& prefix,
    size_t n_samples,
    RandomEngine& rng,
    const ForestParams& params,
    const std::string& data_path)
{
    Logger& logger = Logger::get_instance();
    auto model = std::make_shared<AllocationModel>(params);

    if (blobs_exist(folder, prefix)) {
        try {
            model->load(folder, prefix);
            return model;
        } catch (const std::runtime_error& e) {
            logger.log_warning("model", std::string("Failed to load persisted model, retraining: ") + e.what());
        }
    }

    TrainingDataset dataset;
    if (!data_path.empty() && fs::exists(data_path)) {
        dataset = TrainingDataset::load(data_path);
    } else {
        dataset = generate_training_data(n_samples, rng);
        if (!data_path.empty()) {
            fs::path parent = fs::path(data_path).parent_path();
            if (!parent.empty()) {
                fs::create_directories(parent);
            }
            dataset.save(data_path);
        }
    }

    model->train(dataset);
    model->save(folder, prefix);
    return model;
}

} // namespace cashalloc
