// include/trend_engine/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "trend_engine/core/config_base.hpp"

namespace trend_engine {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Per-bar indicator detail
    DEBUG,    // Signals and warm-up progress
    INFO,     // Accepted intents, run progress
    WARNING,  // Rejections and dropped intents
    ERR,      // Errors that abort a run
    FATAL
};

enum class LogDestination {
    CONSOLE,
    FILE,
    BOTH
};

inline std::string level_to_string(LogLevel level) {
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

inline LogLevel level_from_string(const std::string& str, LogLevel fallback = LogLevel::INFO) {
    if (str == "TRACE")
        return LogLevel::TRACE;
    if (str == "DEBUG")
        return LogLevel::DEBUG;
    if (str == "INFO")
        return LogLevel::INFO;
    if (str == "WARNING")
        return LogLevel::WARNING;
    if (str == "ERROR")
        return LogLevel::ERR;
    if (str == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

inline std::string log_destination_to_string(LogDestination dest) {
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

inline LogDestination log_destination_from_string(const std::string& str,
                                                  LogDestination fallback) {
    if (str == "CONSOLE")
        return LogDestination::CONSOLE;
    if (str == "FILE")
        return LogDestination::FILE;
    if (str == "BOTH")
        return LogDestination::BOTH;
    return fallback;
}

/**
 * @brief Logging section of a run configuration
 *
 * File output goes to <log_directory>/<filename_prefix>_<session>_<part>.log;
 * a new part starts once max_file_size is reached.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"trend_engine"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // Rotate after 50MB
    size_t max_files{10};                    // Oldest files are deleted beyond this

    bool writes_file() const {
        return destination != LogDestination::CONSOLE;
    }

    bool writes_console() const {
        return destination != LogDestination::FILE;
    }

    nlohmann::json to_json() const override {
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

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_level"))
            min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
        if (j.contains("destination"))
            destination =
                log_destination_from_string(j.at("destination").get<std::string>(), destination);
        if (j.contains("log_directory"))
            log_directory = j.at("log_directory").get<std::string>();
        if (j.contains("filename_prefix"))
            filename_prefix = j.at("filename_prefix").get<std::string>();
        if (j.contains("include_timestamp"))
            include_timestamp = j.at("include_timestamp").get<bool>();
        if (j.contains("include_level"))
            include_level = j.at("include_level").get<bool>();
        if (j.contains("max_file_size"))
            max_file_size = j.at("max_file_size").get<size_t>();
        if (j.contains("max_files"))
            max_files = j.at("max_files").get<size_t>();
    }
};

/**
 * @brief Thread-safe process-wide logger
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Path of the file currently written, empty for console-only logging
     */
    std::string current_file() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_path_;
    }

    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_next_file_unsafe();
    void prune_old_files_unsafe();
    void write_to_file_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::string current_path_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{0};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                   \
    do {                                                                      \
        if (level >= ::trend_engine::Logger::instance().get_min_level()) {    \
            std::ostringstream os;                                            \
            os << message;                                                    \
            ::trend_engine::Logger::instance().log(level, os.str());          \
        }                                                                     \
    } while (0)

#define TRACE(message) LOG(::trend_engine::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::trend_engine::LogLevel::DEBUG, message)
#define INFO(message) LOG(::trend_engine::LogLevel::INFO, message)
#define WARN(message) LOG(::trend_engine::LogLevel::WARNING, message)
#define ERROR(message) LOG(::trend_engine::LogLevel::ERR, message)
#define FATAL(message) LOG(::trend_engine::LogLevel::FATAL, message)

}  // namespace trend_engine
