/**
 * @file vfsd_app.hpp
 * @brief Main application class for Simple VFS Daemon
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_VFSD_APP_HPP
#define SIMPLE_VFSD_VFSD_APP_HPP

#include "simple_vfsd/config_manager.hpp"
#include "simple_vfsd/plugin_gateway.hpp"
#include "simple_vfsd/vfs.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SimpleVfsd {

// Forward declarations
class ChangeWatcher;

class VfsdApp {
public:
    VfsdApp();
    ~VfsdApp();

    // Initialize the application. Returns false for --help, --version and
    // on any option, configuration or partition error.
    bool initialize(int argc, char* argv[]);

    // Run the main application loop, or serve a single --read request.
    // Returns the process exit code.
    int run();

    // Stop the application gracefully
    void stop();

    // Check if the application is running
    bool isRunning() const;

    // Core access, serialized through the application's Vfs mutex
    std::optional<VfsItem> readRoute(const Route& route, std::string* error = nullptr);
    std::vector<VfsChange> changesSince(double timestamp);
    void recordChange(const Route& route);
    double currentTime();

    const VfsdConfig& getConfig() const;

    // Performance monitoring
    struct PerformanceMetrics {
        uint64_t total_reads{0};
        uint64_t failed_reads{0};
        uint64_t changes_recorded{0};
        uint64_t watch_events{0};
        std::chrono::steady_clock::time_point start_time;
    };

    // Health check
    struct HealthStatus {
        bool is_healthy;
        std::string status_message;
        std::map<std::string, std::string> details;
    };

    // Get performance metrics
    PerformanceMetrics getMetrics() const;

    // Get health status
    HealthStatus getHealthStatus() const;

private:
    // Configuration
    std::string config_file_;
    bool config_file_explicit_;
    bool daemon_mode_;
    bool verbose_override_;
    std::vector<std::pair<std::string, std::string>> cli_partitions_;
    std::optional<Route> read_request_;
    ConfigManager config_manager_;

    // Application state
    std::atomic<bool> running_;
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> failed_reads_{0};

    // Core
    PassthroughGateway gateway_;
    std::unique_ptr<Vfs> vfs_;
    mutable std::mutex vfs_mutex_;
    std::unique_ptr<ChangeWatcher> watcher_;

    // Private methods
    bool loadConfiguration();
    bool setupLogging();
    bool setupPartitions();
    int serveReadRequest();
    void writePidFile();
    void removePidFile();
    bool mainLoop();
    void showHelp() const;
    void showVersion() const;
};

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_VFSD_APP_HPP
