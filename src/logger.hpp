/**
 * @file logger.hpp
 * @brief Structured logging for the forecast engine
 *
 * The Logger provides structured logging with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (analysis run, organization, year, phase)
 * - Domain events for model fitting, threshold parsing and simulation
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef STARCAST_LOGGER_HPP
#define STARCAST_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace starcast {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (per-draw events, optimizer iterations)
    INFO,    ///< Informational messages (models fitted, simulation complete)
    WARN,    ///< Warning messages (skipped bands, sampling fallbacks)
    ERROR    ///< Error messages (failures, exceptions)
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
 * @brief Context attached to log events
 */
struct LogContext {
    std::string organization_id;     ///< Organization being analyzed (may be empty)
    int year;                        ///< Analysis year (0 if not applicable)
    std::string phase;               ///< Current phase (load, fit, simulate, value)

    LogContext() : organization_id(""), year(0), phase("") {}

    LogContext(const std::string& org, int y, const std::string& p)
        : organization_id(org), year(y), phase(p) {}
};

/**
 * @brief Summary statistics of a finished simulation, for logging
 */
struct SimulationLogSummary {
    size_t draws_requested;
    size_t draws_completed;
    size_t draws_rated;
    size_t sampling_failures;
    double expected_rating;
    double std_dev;
    double execution_time_ms;
    bool cancelled;

    SimulationLogSummary()
        : draws_requested(0), draws_completed(0), draws_rated(0),
          sampling_failures(0), expected_rating(0.0), std_dev(0.0),
          execution_time_ms(0.0), cancelled(false) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)
    size_t max_sampling_warnings;    ///< Per-measure cap on logged sampling failures

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("starcast.log"),
          enable_json(true),
          max_sampling_warnings(5) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   LogContext ctx("H1234", 2025, "simulate");
 *   Logger::get_instance().log_warning(ctx, "measure has no thresholds");
 *   @endcode
 *
 * All methods are safe to call from OpenMP worker threads.
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
     * @brief Log a successfully fitted distribution model
     *
     * @param measure Target measure key
     * @param observations Number of observations used
     * @param iterations Optimizer iterations
     * @param log_likelihood Final log-likelihood
     * @param converged Whether the optimizer met its tolerance
     */
    void log_model_fitted(
        const std::string& measure,
        size_t observations,
        size_t iterations,
        double log_likelihood,
        bool converged
    );

    /**
     * @brief Log a measure left without a model
     *
     * @param measure Target measure key
     * @param reason Why the measure was skipped (insufficient history, fit failure)
     */
    void log_model_skipped(const std::string& measure, const std::string& reason);

    /**
     * @brief Log a cutpoint cell that could not be parsed
     */
    void log_threshold_skipped(
        const std::string& measure,
        const std::string& cell,
        const std::string& reason
    );

    /**
     * @brief Log a per-draw sampling failure that fell back to the observed value
     */
    void log_sampling_failure(
        const LogContext& ctx,
        const std::string& measure,
        size_t draw_index,
        const std::string& error_message
    );

    /**
     * @brief Log simulation completion with summary statistics
     */
    void log_simulation_complete(const LogContext& ctx, const SimulationLogSummary& summary);

    /**
     * @brief Log informational message with context
     */
    void log_info(const LogContext& ctx, const std::string& message);

    /**
     * @brief Log warning message
     */
    void log_warning(const LogContext& ctx, const std::string& warning_message);

    /**
     * @brief Log error with context
     */
    void log_error(const LogContext& ctx, const std::string& error_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    size_t max_sampling_warnings() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    void add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace starcast

#endif // STARCAST_LOGGER_HPP
