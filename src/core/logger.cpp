// src/core/logger.cpp

#include "trend_engine/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>
#include "trend_engine/core/time_utils.hpp"

namespace trend_engine {

thread_local std::string Logger::current_component_;

namespace {

std::string wall_clock_string(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm time_info{};
    core::safe_localtime(&now_c, &time_info);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), format, &time_info);
    return std::string(buffer);
}

}  // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::reset_for_tests() {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig{};
    logger.current_path_.clear();
    logger.session_timestamp_.clear();
    logger.part_number_ = 0;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }
    current_path_.clear();

    if (config_.writes_file()) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        session_timestamp_ = wall_clock_string("%Y%m%d_%H%M%S");
        part_number_ = 0;
        open_next_file_unsafe();

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file: " + current_path_);
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string line = format_message(level, message);
    if (config_.writes_console()) {
        // Warnings and worse go to stderr so a redirected summary stays clean
        (level >= LogLevel::WARNING ? std::cerr : std::cout) << line << '\n';
    }
    if (config_.writes_file()) {
        write_to_file_unsafe(line);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::string line;
    if (config_.include_timestamp) {
        line += wall_clock_string("%Y-%m-%d %H:%M:%S") + " ";
    }
    if (config_.include_level) {
        line += "[" + level_to_string(level) + "] ";
    }
    if (!current_component_.empty()) {
        line += "[" + current_component_ + "] ";
    }
    return line + message;
}

void Logger::write_to_file_unsafe(const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        log_file_.close();
        open_next_file_unsafe();
    }
}

void Logger::open_next_file_unsafe() {
    // Keep room for the file about to be created
    prune_old_files_unsafe();

    ++part_number_;
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    std::filesystem::path path =
        log_dir / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                   std::to_string(part_number_) + ".log");

    log_file_.open(path, std::ios::app);
    current_path_ = path.string();
}

void Logger::prune_old_files_unsafe() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    std::error_code ec;
    if (!std::filesystem::exists(log_dir, ec)) {
        return;
    }

    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log" &&
            entry.path().filename().string().rfind(config_.filename_prefix, 0) == 0) {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

}  // namespace trend_engine
