/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "evaluation.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cashalloc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_evaluation_complete(const std::string& source, const EvaluationOutcome& outcome) {
    std::map<std::string, std::string> fields;
    fields["event"] = "evaluation_complete";
    fields["source"] = source;
    fields["valid"] = outcome.valid ? "true" : "false";
    fields["reserve_pct"] = format_number(outcome.reserve_pct);
    fields["growth_pct"] = format_number(outcome.growth_pct);
    fields["risk_pct"] = format_number(outcome.risk_pct);
    fields["bad_survival_probability"] = format_number(outcome.bad_survival_probability);
    fields["bad_time_to_zero"] = format_number(outcome.bad_time_to_zero);
    fields["monte_carlo"] = outcome.used_monte_carlo ? "true" : "false";
    if (outcome.used_monte_carlo) {
        fields["monte_carlo_runs"] = std::to_string(outcome.monte_carlo_runs);
    }

    log(LogLevel::INFO, "Allocation evaluated", fields);
}

void Logger::log_monte_carlo_complete(
    const std::string& scenario,
    size_t runs,
    double survival_probability,
    double mean_time_to_zero,
    double execution_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "monte_carlo_complete";
    fields["scenario"] = scenario;
    fields["runs"] = std::to_string(runs);
    fields["survival_probability"] = format_number(survival_probability);
    fields["mean_time_to_zero"] = format_number(mean_time_to_zero);
    fields["execution_time_ms"] = format_number(execution_time_ms);

    log(LogLevel::DEBUG, "Monte Carlo estimate complete", fields);
}

void Logger::log_training_progress(size_t processed, size_t total) {
    std::map<std::string, std::string> fields;
    fields["event"] = "training_data_progress";
    fields["processed"] = std::to_string(processed);
    fields["total"] = std::to_string(total);

    log(LogLevel::INFO, "Generating training samples", fields);
}

void Logger::log_training_start(size_t samples, size_t n_estimators) {
    std::map<std::string, std::string> fields;
    fields["event"] = "training_start";
    fields["samples"] = std::to_string(samples);
    fields["n_estimators"] = std::to_string(n_estimators);

    log(LogLevel::INFO, "Training allocation regressors", fields);
}

void Logger::log_training_complete(
    size_t samples,
    double r2_reserve,
    double r2_growth,
    double r2_risk,
    double execution_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "training_complete";
    fields["samples"] = std::to_string(samples);
    fields["r2_reserve"] = format_number(r2_reserve);
    fields["r2_growth"] = format_number(r2_growth);
    fields["r2_risk"] = format_number(r2_risk);
    fields["execution_time_ms"] = format_number(execution_time_ms);

    log(LogLevel::INFO, "Allocation regressors trained", fields);
}

void Logger::log_model_io(const std::string& action, const std::string& folder,
                          const std::string& prefix) {
    std::map<std::string, std::string> fields;
    fields["event"] = "model_" + action;
    fields["folder"] = folder;
    fields["prefix"] = prefix;

    log(LogLevel::INFO, "Allocation model " + action, fields);
}

void Logger::log_warning(const std::string& component, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["component"] = component;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const std::string& component, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["component"] = component;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Engine error", fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string Logger::format_number(double value) const {
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << value;
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace cashalloc
