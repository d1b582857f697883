/**
 * @file logger.cpp
 * @brief Logger implementation for Simple VFS Daemon
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include "simple_vfsd/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace SimpleVfsd {

Logger::Logger() : current_level_(LogLevel::INFO) {
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool Logger::initialize(LogLevel level, const std::string& log_file) {
    Logger& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex_);

    instance.current_level_ = level;
    instance.log_file_.reset();

    if (log_file.empty()) {
        return true;
    }

    instance.log_file_ = std::make_unique<std::ofstream>(log_file, std::ios::app);
    if (!instance.log_file_->is_open()) {
        // Fall back to stderr
        instance.log_file_.reset();
        std::cerr << "[Logger] Could not open log file '" << log_file << "', logging to stderr" << std::endl;
        return false;
    }

    return true;
}

void Logger::setLevel(LogLevel level) {
    Logger& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex_);
    instance.current_level_ = level;
}

LogLevel Logger::getLevel() {
    Logger& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex_);
    return instance.current_level_;
}

void Logger::shutdown() {
    Logger& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex_);

    if (instance.log_file_ && instance.log_file_->is_open()) {
        instance.log_file_->close();
    }
    instance.log_file_.reset();
}

bool Logger::isEnabled(LogLevel level) {
    if (level == LogLevel::OFF) {
        return false;
    }
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void Logger::debug(const std::string& message) {
    if (isEnabled(LogLevel::DEBUG)) {
        getInstance().write(LogLevel::DEBUG, message);
    }
}

void Logger::info(const std::string& message) {
    if (isEnabled(LogLevel::INFO)) {
        getInstance().write(LogLevel::INFO, message);
    }
}

void Logger::warn(const std::string& message) {
    if (isEnabled(LogLevel::WARN)) {
        getInstance().write(LogLevel::WARN, message);
    }
}

void Logger::error(const std::string& message) {
    if (isEnabled(LogLevel::ERROR)) {
        getInstance().write(LogLevel::ERROR, message);
    }
}

bool Logger::parseLevel(const std::string& text, LogLevel& level) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::WARN;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else if (lower == "off" || lower == "none") {
        level = LogLevel::OFF;
    } else {
        return false;
    }

    return true;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm;
    localtime_r(&time_t, &local_tm);

    std::ostream& out = log_file_ ? static_cast<std::ostream&>(*log_file_) : std::cerr;
    out << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << " [" << levelName(level) << "] " << message << std::endl;
}

} // namespace SimpleVfsd
