// include/divcap/core/logger.hpp
#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "divcap/core/config_base.hpp"

namespace divcap {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect operation
    ERR,      // Errors that affect operation but don't stop the run
    FATAL     // Errors that abort the run
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Console stream (stdout unless redirected)
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};  // Minimum level to log
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};      // Directory for log files
    std::string filename_prefix{"divcap"};  // Prefix for log files
    bool include_timestamp{true};           // Include timestamp in logs
    bool include_level{true};               // Include log level in logs
    size_t max_file_size{50 * 1024 * 1024}; // Max log file size (50MB)
    size_t max_files{10};                   // Maximum number of log files to keep

    nlohmann::json to_json() const override;

    /**
     * @brief Load from JSON; every key is required and unknown keys are rejected
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Logger scoped to one backtest run
 *
 * Components receive a std::shared_ptr<Logger> rather than reaching for a
 * global instance. Writes are serialised by an internal mutex.
 */
class Logger {
public:
    /**
     * @brief Create a logger, opening the session log file when FILE output is configured
     * @param config Logger configuration
     * @param console Stream used for console output
     * @throws BacktestError with FILE_IO_ERROR if the log directory or file cannot be opened
     */
    explicit Logger(const LoggerConfig& config, std::ostream& console = std::cout);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Log a message with specified level
     * @param level Log level
     * @param message Message to log
     */
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.min_level;
    }

    /**
     * @brief Path of the file currently written to, empty for console-only loggers
     */
    std::filesystem::path current_file() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_file_;
    }

private:
    void open_session_file();
    void enforce_retention(const std::filesystem::path& log_dir) const;
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ostream& console_;
    std::ofstream log_file_;
    std::filesystem::path current_file_;

    std::string session_timestamp_;  // Format: YYYYMMDD_HHMMSS
    int part_number_{1};
};

/**
 * @brief Convenience macro for logging through a logger pointer
 * Usage: LOG(logger_, LogLevel::INFO, "Message: " << variable)
 * A null logger discards the message.
 */
#define LOG(logger, level, message)                                      \
    do {                                                                 \
        if ((logger) && (level) >= (logger)->get_min_level()) {          \
            std::ostringstream divcap_log_os_;                           \
            divcap_log_os_ << message;                                   \
            (logger)->log(level, divcap_log_os_.str());                  \
        }                                                                \
    } while (0)

#define TRACE(logger, message) LOG(logger, ::divcap::LogLevel::TRACE, message)
#define DEBUG(logger, message) LOG(logger, ::divcap::LogLevel::DEBUG, message)
#define INFO(logger, message) LOG(logger, ::divcap::LogLevel::INFO, message)
#define WARN(logger, message) LOG(logger, ::divcap::LogLevel::WARNING, message)
#define ERROR(logger, message) LOG(logger, ::divcap::LogLevel::ERR, message)
#define FATAL(logger, message) LOG(logger, ::divcap::LogLevel::FATAL, message)

}  // namespace divcap
