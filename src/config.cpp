#include "config.hpp"
#include "model/allocation_model.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace cashalloc {

ModelSettings::ModelSettings()
    : folder(DEFAULT_MODEL_FOLDER), prefix(DEFAULT_MODEL_PREFIX) {}

TrainingSettings::TrainingSettings()
    : samples(DEFAULT_TRAINING_SAMPLES) {}

EngineConfig::EngineConfig()
    : seed(42) {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        // A lone '$' is kept as-is
        if (var_name.empty() && !braces) {
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

template <typename T>
void read_optional(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section[key].get<T>();
    }
}

// Counts and seeds must be non-negative JSON integers
template <typename T>
void read_optional_count(const json& section, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    const json& value = section[key];
    if (!value.is_number()) {
        throw ConfigParseError(std::string(key) + " must be a number");
    }
    if (!value.is_number_integer() ||
        (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
        throw ValidationError(std::string(key) + " must be a non-negative whole number, got " +
                              value.dump());
    }
    target = value.get<T>();
}

int read_whole_months(const json& value, const char* key) {
    if (!value.is_number()) {
        throw ConfigParseError(std::string(key) + " must be a number");
    }
    if (!value.is_number_integer()) {
        throw ValidationError(std::string(key) + " must be a whole number, got " + value.dump());
    }
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ValidationError(std::string(key) + " is out of range: " + value.dump());
        }
    } else if (value.get<int64_t>() < std::numeric_limits<int>::min() ||
               value.get<int64_t>() > std::numeric_limits<int>::max()) {
        throw ValidationError(std::string(key) + " is out of range: " + value.dump());
    }
    return value.get<int>();
}

void read_optional_path(const json& section, const char* key, std::string& target) {
    if (section.contains(key)) {
        target = expand_environment_variables(section[key].get<std::string>());
    }
}

void validate_engine_config(const EngineConfig& config) {
    if (config.evaluation.monte_carlo_runs == 0) {
        throw ValidationError("simulation.monte_carlo_runs must be positive");
    }
    if (!(config.evaluation.survival_threshold >= 0.0 && config.evaluation.survival_threshold <= 1.0)) {
        throw ValidationError("simulation.survival_threshold must be within [0, 1]");
    }
    if (config.model.forest.n_estimators == 0) {
        throw ValidationError("model.n_estimators must be positive");
    }
    if (config.model.forest.min_samples_split < 2) {
        throw ValidationError("model.min_samples_split must be at least 2");
    }
    if (config.model.forest.min_samples_leaf == 0) {
        throw ValidationError("model.min_samples_leaf must be positive");
    }
    if (config.model.folder.empty() || config.model.prefix.empty()) {
        throw ValidationError("model.folder and model.prefix must not be empty");
    }
}

} // anonymous namespace

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Engine config must be a JSON object");
        }

        if (j.contains("simulation")) {
            const json& sim = j["simulation"];
            read_optional_count(sim, "monte_carlo_runs", config.evaluation.monte_carlo_runs);
            read_optional(sim, "survival_threshold", config.evaluation.survival_threshold);
            read_optional_count(sim, "seed", config.seed);
        }

        if (j.contains("model")) {
            const json& model = j["model"];
            read_optional_path(model, "folder", config.model.folder);
            read_optional_path(model, "prefix", config.model.prefix);
            read_optional_count(model, "n_estimators", config.model.forest.n_estimators);
            read_optional_count(model, "max_depth", config.model.forest.max_depth);
            read_optional_count(model, "min_samples_split", config.model.forest.min_samples_split);
            read_optional_count(model, "min_samples_leaf", config.model.forest.min_samples_leaf);
            read_optional_count(model, "seed", config.model.forest.seed);
        }

        if (j.contains("training")) {
            const json& training = j["training"];
            read_optional_count(training, "samples", config.training.samples);
            read_optional_path(training, "data_path", config.training.data_path);
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) {
                std::string level = logging["level"].get<std::string>();
                if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
                    throw ConfigParseError("Unknown logging.level: " + level);
                }
                config.logging.min_level = string_to_level(level);
            }
            read_optional(logging, "console", config.logging.enable_console);
            read_optional(logging, "json", config.logging.enable_json);
            if (logging.contains("file")) {
                config.logging.log_file_path =
                    expand_environment_variables(logging["file"].get<std::string>());
                config.logging.enable_file = !config.logging.log_file_path.empty();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    }

    validate_engine_config(config);

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = parse_engine_config_from_string(buffer.str());

    // Resolve relative paths
    config.model.folder = resolve_relative_path(config.model.folder, file_path);
    if (!config.training.data_path.empty()) {
        config.training.data_path = resolve_relative_path(config.training.data_path, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

ParameterSet parse_parameter_set(const json& j) {
    static const char* const required[] = {
        "cash_on_hand", "expected_monthly_cash", "fixed_expenses", "variable_expenses",
        "cash_volatility", "risk_tolerance", "protected_months"
    };

    if (!j.is_object()) {
        throw ConfigParseError("Parameter set must be a JSON object");
    }
    for (const char* key : required) {
        if (!j.contains(key)) {
            throw ConfigParseError(std::string("Missing required field: ") + key);
        }
    }

    try {
        InvestmentOpportunities investments;
        read_optional(j, "safe_return", investments.safe_return);
        read_optional(j, "medium_return", investments.medium_return);
        read_optional(j, "high_return", investments.high_return);
        read_optional(j, "safe_volatility", investments.safe_volatility);
        read_optional(j, "medium_volatility", investments.medium_volatility);
        read_optional(j, "high_volatility", investments.high_volatility);

        return ParameterSet(
            j["cash_on_hand"].get<double>(),
            j["expected_monthly_cash"].get<double>(),
            j["fixed_expenses"].get<double>(),
            j["variable_expenses"].get<double>(),
            j["cash_volatility"].get<double>(),
            j["risk_tolerance"].get<double>(),
            read_whole_months(j["protected_months"], "protected_months"),
            investments
        );
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
}

ParameterSet parse_parameter_set_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open parameter file: " + file_path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    return parse_parameter_set(j);
}

} // namespace cashalloc
