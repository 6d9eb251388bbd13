/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace starcast {

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
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

size_t Logger::max_sampling_warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.max_sampling_warnings;
}

void Logger::log_model_fitted(
    const std::string& measure,
    size_t observations,
    size_t iterations,
    double log_likelihood,
    bool converged
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "model_fitted";
    fields["measure"] = measure;
    fields["observations"] = std::to_string(observations);
    fields["iterations"] = std::to_string(iterations);
    fields["log_likelihood"] = std::to_string(log_likelihood);
    fields["converged"] = converged ? "true" : "false";

    log(converged ? LogLevel::INFO : LogLevel::WARN, "Fitted distribution model", std::move(fields));
}

void Logger::log_model_skipped(const std::string& measure, const std::string& reason) {
    std::map<std::string, std::string> fields;
    fields["event"] = "model_skipped";
    fields["measure"] = measure;
    fields["reason"] = reason;

    log(LogLevel::INFO, "Measure left unmodeled", std::move(fields));
}

void Logger::log_threshold_skipped(
    const std::string& measure,
    const std::string& cell,
    const std::string& reason
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "threshold_skipped";
    fields["measure"] = measure;
    fields["cell"] = cell;
    fields["reason"] = reason;

    log(LogLevel::WARN, "Could not parse threshold band", std::move(fields));
}

void Logger::log_sampling_failure(
    const LogContext& ctx,
    const std::string& measure,
    size_t draw_index,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "sampling_failure";
    add_context(fields, ctx);
    fields["measure"] = measure;
    fields["draw"] = std::to_string(draw_index);
    fields["error_message"] = error_message;

    log(LogLevel::WARN, "Sampling failed, using observed value", std::move(fields));
}

void Logger::log_simulation_complete(const LogContext& ctx, const SimulationLogSummary& summary) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_complete";
    add_context(fields, ctx);
    fields["draws_requested"] = std::to_string(summary.draws_requested);
    fields["draws_completed"] = std::to_string(summary.draws_completed);
    fields["draws_rated"] = std::to_string(summary.draws_rated);
    fields["sampling_failures"] = std::to_string(summary.sampling_failures);
    fields["expected_rating"] = std::to_string(summary.expected_rating);
    fields["std_dev"] = std::to_string(summary.std_dev);
    fields["execution_time_ms"] = std::to_string(summary.execution_time_ms);
    fields["cancelled"] = summary.cancelled ? "true" : "false";
    fields["draws_per_sec"] = std::to_string(
        summary.execution_time_ms > 0 ? (summary.draws_completed * 1000.0 / summary.execution_time_ms) : 0
    );

    log(summary.cancelled ? LogLevel::WARN : LogLevel::INFO, "Simulation completed", std::move(fields));
}

void Logger::log_info(const LogContext& ctx, const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "info";
    add_context(fields, ctx);

    log(LogLevel::INFO, message, std::move(fields));
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Analysis error", std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const {
    if (!ctx.organization_id.empty()) {
        fields["organization_id"] = ctx.organization_id;
    }
    if (ctx.year != 0) {
        fields["year"] = std::to_string(ctx.year);
    }
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
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

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace starcast
