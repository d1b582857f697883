/**
 * @file vfsd_app.cpp
 * @brief Implementation of VfsdApp class for Simple VFS Daemon
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include "simple_vfsd/vfsd_app.hpp"
#include "simple_vfsd/change_watcher.hpp"
#include "simple_vfsd/logger.hpp"
#include "simple_vfsd/serialization.hpp"
#include "simple_vfsd/vfs_error.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace SimpleVfsd {

namespace {
const char* const DEFAULT_CONFIG_FILE = "/etc/simple-vfsd/simple-vfsd.conf";
const char* const VERSION = "0.1.0";
}

VfsdApp::VfsdApp()
    : config_file_(DEFAULT_CONFIG_FILE)
    , config_file_explicit_(false)
    , daemon_mode_(false)
    , verbose_override_(false)
    , running_(false)
    , start_time_(std::chrono::steady_clock::now()) {
}

VfsdApp::~VfsdApp() {
    stop();
    if (watcher_) {
        watcher_->stop();
    }
}

bool VfsdApp::initialize(int argc, char* argv[]) {
    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            showHelp();
            return false;
        } else if (arg == "--version" || arg == "-v") {
            showVersion();
            return false;
        } else if (arg == "--daemon" || arg == "-d") {
            daemon_mode_ = true;
        } else if (arg == "--verbose" || arg == "-V") {
            verbose_override_ = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) {
                config_file_ = argv[++i];
                config_file_explicit_ = true;
            } else {
                std::cerr << "Error: --config requires a filename" << std::endl;
                return false;
            }
        } else if (arg == "--partition" || arg == "-p") {
            if (i + 1 < argc) {
                std::string partition_arg = argv[++i];
                size_t eq = partition_arg.find('=');
                if (eq == std::string::npos || eq == 0) {
                    std::cerr << "Error: --partition expects NAME=PATH, got '" << partition_arg << "'" << std::endl;
                    return false;
                }
                cli_partitions_.emplace_back(partition_arg.substr(0, eq), partition_arg.substr(eq + 1));
            } else {
                std::cerr << "Error: --partition requires NAME=PATH" << std::endl;
                return false;
            }
        } else if (arg == "--read" || arg == "-r") {
            if (i + 1 < argc) {
                read_request_ = parseRoute(argv[++i]);
            } else {
                std::cerr << "Error: --read requires a route" << std::endl;
                return false;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            showHelp();
            return false;
        }
    }

    if (!loadConfiguration()) {
        return false;
    }

    if (!setupLogging()) {
        return false;
    }

    return setupPartitions();
}

int VfsdApp::run() {
    if (!vfs_) {
        Logger::error("Application is not initialized");
        return 1;
    }

    if (read_request_) {
        return serveReadRequest();
    }

    if (daemon_mode_) {
        // Fork to create daemon process
        pid_t pid = fork();
        if (pid < 0) {
            Logger::error("Failed to fork daemon process");
            return 1;
        } else if (pid > 0) {
            // Parent process exits
            return 0;
        }

        // Child process continues
        setsid();

        if (chdir("/") != 0) {
            Logger::warn("Failed to change directory to /");
        }

        close(STDIN_FILENO);
        close(STDOUT_FILENO);
        if (getConfig().log_file.empty()) {
            Logger::setLevel(LogLevel::OFF);
        }
        close(STDERR_FILENO);

        writePidFile();
    }

    bool clean = mainLoop();

    if (daemon_mode_) {
        removePidFile();
    }

    return clean ? 0 : 1;
}

void VfsdApp::stop() {
    running_ = false;
}

bool VfsdApp::isRunning() const {
    return running_;
}

std::optional<VfsItem> VfsdApp::readRoute(const Route& route, std::string* error) {
    if (!vfs_) {
        if (error) {
            *error = "Application is not initialized";
        }
        return std::nullopt;
    }

    total_reads_++;

    try {
        std::lock_guard<std::mutex> lock(vfs_mutex_);
        return vfs_->read(route);
    } catch (const VfsError& e) {
        failed_reads_++;
        Logger::debug(std::string("Read failed: ") + e.what());
        if (error) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

std::vector<VfsChange> VfsdApp::changesSince(double timestamp) {
    std::lock_guard<std::mutex> lock(vfs_mutex_);
    if (!vfs_) {
        return {};
    }
    return vfs_->changesSince(timestamp);
}

void VfsdApp::recordChange(const Route& route) {
    std::lock_guard<std::mutex> lock(vfs_mutex_);
    if (!vfs_) {
        return;
    }
    vfs_->addChange(vfs_->currentTime(), route);
}

double VfsdApp::currentTime() {
    std::lock_guard<std::mutex> lock(vfs_mutex_);
    return vfs_ ? vfs_->currentTime() : 0.0;
}

const VfsdConfig& VfsdApp::getConfig() const {
    return config_manager_.getConfig();
}

bool VfsdApp::loadConfiguration() {
    std::error_code ec;
    if (config_file_explicit_ || std::filesystem::exists(config_file_, ec)) {
        if (!config_manager_.loadFromFile(config_file_)) {
            std::cerr << "Failed to load configuration from: " << config_file_ << std::endl;
            return false;
        }
    }

    for (const auto& partition : cli_partitions_) {
        config_manager_.setPartition(partition.first, partition.second);
    }

    if (verbose_override_) {
        VfsdConfig config = config_manager_.getConfig();
        config.verbose = true;
        config_manager_.setConfig(config);
    }

    return config_manager_.validate();
}

bool VfsdApp::setupLogging() {
    const VfsdConfig& config = getConfig();

    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLevel(config.log_level, level)) {
        std::cerr << "Invalid log level: " << config.log_level << std::endl;
        return false;
    }

    if (!Logger::initialize(level, config.log_file)) {
        std::cerr << "Failed to open log file: " << config.log_file << std::endl;
        return false;
    }

    return true;
}

bool VfsdApp::setupPartitions() {
    const VfsdConfig& config = getConfig();
    vfs_ = std::make_unique<Vfs>(gateway_, config.verbose);

    for (const auto& partition : config.partitions) {
        if (!vfs_->addPartition(partition.name, partition.path)) {
            return false;
        }
    }

    Logger::info("Registered " + std::to_string(vfs_->partitions().size()) + " partitions");
    return true;
}

int VfsdApp::serveReadRequest() {
    std::string error;
    auto item = readRoute(*read_request_, &error);
    if (!item) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    std::cout << writeJson(toJson(*item), true) << std::endl;
    return 0;
}

void VfsdApp::writePidFile() {
    const std::string& pid_file = getConfig().pid_file;
    if (pid_file.empty()) {
        return;
    }

    std::ofstream out(pid_file);
    if (out.is_open()) {
        out << getpid() << std::endl;
    } else {
        Logger::warn("Failed to write PID file: " + pid_file);
    }
}

void VfsdApp::removePidFile() {
    const std::string& pid_file = getConfig().pid_file;
    if (!pid_file.empty()) {
        unlink(pid_file.c_str());
    }
}

bool VfsdApp::mainLoop() {
    Logger::info("Simple VFS Daemon starting...");

    const VfsdConfig& config = getConfig();
    if (config.watch) {
        watcher_ = std::make_unique<ChangeWatcher>(*vfs_, vfs_mutex_, config.poll_interval_ms);
        if (!watcher_->start()) {
            Logger::error("Failed to start change watcher");
            watcher_.reset();
            return false;
        }
    }

    running_ = true;
    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config.poll_interval_ms));
    }

    if (watcher_) {
        watcher_->stop();
    }

    Logger::info("Simple VFS Daemon stopping...");
    return true;
}

void VfsdApp::showHelp() const {
    std::cout << "Simple VFS Daemon v" << VERSION << std::endl;
    std::cout << "Usage: simple-vfsd [OPTIONS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help              Show this help message" << std::endl;
    std::cout << "  -v, --version           Show version information" << std::endl;
    std::cout << "  -d, --daemon            Run as daemon" << std::endl;
    std::cout << "  -V, --verbose           Log every change as it is processed" << std::endl;
    std::cout << "  -c, --config FILE       Configuration file (default: " << DEFAULT_CONFIG_FILE << ")" << std::endl;
    std::cout << "  -p, --partition N=PATH  Register partition N at absolute PATH (repeatable)" << std::endl;
    std::cout << "  -r, --read ROUTE        Print the JSON snapshot of ROUTE (e.g. site/posts) and exit" << std::endl;
}

void VfsdApp::showVersion() const {
    std::cout << "Simple VFS Daemon v" << VERSION << std::endl;
    std::cout << "A partitioned virtual filesystem with change tracking" << std::endl;
}

VfsdApp::PerformanceMetrics VfsdApp::getMetrics() const {
    PerformanceMetrics metrics;
    metrics.total_reads = total_reads_.load();
    metrics.failed_reads = failed_reads_.load();
    metrics.start_time = start_time_;

    {
        std::lock_guard<std::mutex> lock(vfs_mutex_);
        if (vfs_) {
            metrics.changes_recorded = vfs_->changeHistory().size();
        }
    }

    if (watcher_) {
        metrics.watch_events = watcher_->getEventCount();
    }

    return metrics;
}

VfsdApp::HealthStatus VfsdApp::getHealthStatus() const {
    HealthStatus status;
    status.is_healthy = true;
    status.status_message = "OK";

    // Check if application is running
    if (!running_) {
        status.is_healthy = false;
        status.status_message = "Application not running";
        return status;
    }

    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_);
    PerformanceMetrics metrics = getMetrics();

    status.details["uptime_seconds"] = std::to_string(uptime.count());
    status.details["total_reads"] = std::to_string(metrics.total_reads);
    status.details["failed_reads"] = std::to_string(metrics.failed_reads);
    status.details["changes_recorded"] = std::to_string(metrics.changes_recorded);
    status.details["watch_events"] = std::to_string(metrics.watch_events);

    if (getConfig().watch && !(watcher_ && watcher_->isRunning())) {
        status.is_healthy = false;
        status.status_message = "Change watcher not running";
    }

    return status;
}

} // namespace SimpleVfsd
