// src/core/logger.cpp

#include "divcap/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <vector>
#include "divcap/core/error.hpp"
#include "divcap/core/time_utils.hpp"

namespace divcap {

namespace {

std::string generate_session_timestamp() {
    return core::get_formatted_time("%Y%m%d_%H%M%S");
}

LogLevel level_from_string(const std::string& text) {
    if (text == "TRACE")
        return LogLevel::TRACE;
    if (text == "DEBUG")
        return LogLevel::DEBUG;
    if (text == "INFO")
        return LogLevel::INFO;
    if (text == "WARNING")
        return LogLevel::WARNING;
    if (text == "ERROR")
        return LogLevel::ERR;
    if (text == "FATAL")
        return LogLevel::FATAL;
    throw BacktestError(ErrorCode::INVALID_CONFIG, "Unknown log level: " + text, "LoggerConfig");
}

LogDestination destination_from_string(const std::string& text) {
    if (text == "CONSOLE")
        return LogDestination::CONSOLE;
    if (text == "FILE")
        return LogDestination::FILE;
    if (text == "BOTH")
        return LogDestination::BOTH;
    throw BacktestError(ErrorCode::INVALID_CONFIG, "Unknown log destination: " + text,
                        "LoggerConfig");
}

}  // namespace

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    const std::string section = "logging";
    config::require_exact_keys(j, section,
                               {"min_level", "destination", "log_directory", "filename_prefix",
                                "include_timestamp", "include_level", "max_file_size",
                                "max_files"});

    min_level = level_from_string(config::get_field<std::string>(j, section, "min_level"));
    destination =
        destination_from_string(config::get_field<std::string>(j, section, "destination"));
    log_directory = config::get_field<std::string>(j, section, "log_directory");
    filename_prefix = config::get_field<std::string>(j, section, "filename_prefix");
    include_timestamp = config::get_field<bool>(j, section, "include_timestamp");
    include_level = config::get_field<bool>(j, section, "include_level");
    max_file_size = config::get_field<size_t>(j, section, "max_file_size");
    max_files = config::get_field<size_t>(j, section, "max_files");

    if (max_files == 0) {
        throw BacktestError(ErrorCode::INVALID_CONFIG, "logging.max_files must be at least 1",
                            "LoggerConfig");
    }
}

Logger::Logger(const LoggerConfig& config, std::ostream& console)
    : config_(config), console_(console) {
    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        open_session_file();
    }
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::open_session_file() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        throw BacktestError(ErrorCode::FILE_IO_ERROR,
                            "Failed to create log directory: " + log_dir.string() + " - " +
                                ec.message(),
                            "Logger");
    }

    enforce_retention(log_dir);

    session_timestamp_ = generate_session_timestamp();
    part_number_ = 1;

    // prefix_YYYYMMDD_HHMMSS_partN.log
    current_file_ = log_dir / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                               std::to_string(part_number_) + ".log");
    log_file_.open(current_file_, std::ios::app);

    if (!log_file_.is_open()) {
        throw BacktestError(ErrorCode::FILE_IO_ERROR,
                            "Failed to open log file: " + current_file_.string(), "Logger");
    }
}

void Logger::enforce_retention(const std::filesystem::path& log_dir) const {
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log" &&
            entry.path().filename().string().rfind(config_.filename_prefix, 0) == 0) {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Leave room for the file about to be opened
    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string formatted_message = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        console_ << formatted_message << std::endl;
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file_unsafe(formatted_message);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }

    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }

    ss << message;
    return ss.str();
}

void Logger::write_to_file_unsafe(const std::string& message) {
    // Assumes mutex is already held
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

void Logger::rotate_log_files() {
    log_file_.close();

    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    enforce_retention(log_dir);

    ++part_number_;
    current_file_ = log_dir / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                               std::to_string(part_number_) + ".log");
    log_file_.open(current_file_, std::ios::app);
}

}  // namespace divcap
