/**
 * @file logger.hpp
 * @brief Process-wide levelled logger for Simple VFS Daemon
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_LOGGER_HPP
#define SIMPLE_VFSD_LOGGER_HPP

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace SimpleVfsd {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

class Logger {
public:
    // Configure threshold and destination. An empty file name logs to stderr.
    static bool initialize(LogLevel level, const std::string& log_file = "");
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void shutdown();

    static bool isEnabled(LogLevel level);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "debug", "info", "warn"/"warning", "error", "off" (case-insensitive)
    static bool parseLevel(const std::string& text, LogLevel& level);
    static const char* levelName(LogLevel level);

private:
    Logger();

    static Logger& getInstance();
    void write(LogLevel level, const std::string& message);

    std::mutex log_mutex_;
    LogLevel current_level_;
    std::unique_ptr<std::ofstream> log_file_;
};

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_LOGGER_HPP
