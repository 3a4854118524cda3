/**
 * @file logger.hpp
 * @brief Structured logging for the allocation engine with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Events for evaluations, Monte Carlo estimates, training and model I/O
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef CASHALLOC_LOGGER_HPP
#define CASHALLOC_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace cashalloc {

struct EvaluationOutcome;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-estimate statistics
    INFO,    ///< Evaluations, training progress, model I/O
    WARN,    ///< Non-fatal issues
    ERROR    ///< Failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("cashalloc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "cashalloc.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   logger.log_evaluation_complete("advisor", outcome);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a finished allocation evaluation
     *
     * @param source Where the allocation came from ("advisor", "model", "caller")
     * @param outcome Evaluation outcome
     */
    void log_evaluation_complete(const std::string& source, const EvaluationOutcome& outcome);

    /**
     * @brief Log a finished Monte Carlo estimate (DEBUG)
     */
    void log_monte_carlo_complete(
        const std::string& scenario,
        size_t runs,
        double survival_probability,
        double mean_time_to_zero,
        double execution_time_ms
    );

    /**
     * @brief Log training data generation progress
     */
    void log_training_progress(size_t processed, size_t total);

    /**
     * @brief Log start of regressor training
     */
    void log_training_start(size_t samples, size_t n_estimators);

    /**
     * @brief Log completion of regressor training with in-sample R² per target
     */
    void log_training_complete(
        size_t samples,
        double r2_reserve,
        double r2_growth,
        double r2_risk,
        double execution_time_ms
    );

    /**
     * @brief Log model persistence
     *
     * @param action "saved" or "loaded"
     * @param folder Model folder
     * @param prefix Blob name prefix
     */
    void log_model_io(const std::string& action, const std::string& folder,
                      const std::string& prefix);

    /**
     * @brief Log warning message
     */
    void log_warning(const std::string& component, const std::string& warning_message);

    /**
     * @brief Log error with context
     */
    void log_error(const std::string& component, const std::string& error_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    std::string format_number(double value) const;
    void write_output(const std::string& output);
};

} // namespace cashalloc

#endif // CASHALLOC_LOGGER_HPP
