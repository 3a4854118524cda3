#ifndef CASHALLOC_CONFIG_HPP
#define CASHALLOC_CONFIG_HPP

#include "evaluation.hpp"
#include "logger.hpp"
#include "parameters.hpp"
#include "model/random_forest.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace cashalloc {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

struct ModelSettings {
    std::string folder;           // Blob folder, default "models"
    std::string prefix;           // Blob prefix, default "allocation_model"
    ForestParams forest;

    ModelSettings();
};

struct TrainingSettings {
    size_t samples;               // Synthetic samples generated when training
    std::string data_path;        // Optional CSV/Parquet dataset cache (empty = none)

    TrainingSettings();
};

/**
 * @brief Engine configuration
 *
 * JSON layout (every section and key optional):
 *   {
 *     "simulation": {"monte_carlo_runs": 500, "survival_threshold": 0.7, "seed": 42},
 *     "model":      {"folder": "models", "prefix": "allocation_model",
 *                    "n_estimators": 100, "max_depth": 0,
 *                    "min_samples_split": 2, "min_samples_leaf": 1, "seed": 42},
 *     "training":   {"samples": 10000, "data_path": "data/training_data.csv"},
 *     "logging":    {"level": "INFO", "console": true, "file": "", "json": true}
 *   }
 */
struct EngineConfig {
    EvaluationConfig evaluation;
    uint64_t seed;                // Seed for the simulation random engine
    ModelSettings model;
    TrainingSettings training;
    LoggerConfig logging;

    EngineConfig();
};

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * Relative model folder, dataset and log file paths are resolved against
 * the directory containing the config file.
 *
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ValidationError if a value is out of range
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * @throws ConfigParseError if JSON is invalid
 * @throws ValidationError if a value is out of range
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Builds a ParameterSet from a JSON object
 *
 * Required: cash_on_hand, expected_monthly_cash, fixed_expenses,
 * variable_expenses, cash_volatility, risk_tolerance, protected_months.
 * Optional: safe_return, medium_return, high_return, safe_volatility,
 * medium_volatility, high_volatility.
 *
 * @throws ConfigParseError if a required key is missing or mistyped
 * @throws ValidationError if the values are invalid
 */
ParameterSet parse_parameter_set(const nlohmann::json& j);

ParameterSet parse_parameter_set_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace cashalloc

#endif // CASHALLOC_CONFIG_HPP
