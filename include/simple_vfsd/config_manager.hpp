/*
 * Copyright 2024 SimpleDaemons
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef SIMPLE_VFSD_CONFIG_MANAGER_HPP
#define SIMPLE_VFSD_CONFIG_MANAGER_HPP

#include <string>
#include <vector>

namespace SimpleVfsd {

enum class ConfigFormat {
    INI,
    JSON,
    YAML
};

struct VfsdConfig {
    // Global settings
    bool verbose;
    bool watch;
    int poll_interval_ms;
    std::string pid_file;

    // Logging settings
    std::string log_level;
    std::string log_file;

    // Partition settings
    struct Partition {
        std::string name;
        std::string path;
    };
    std::vector<Partition> partitions;

    // Default constructor
    VfsdConfig();
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Save configuration to file
    bool saveToFile(const std::string& filename, ConfigFormat format = ConfigFormat::INI) const;

    // Get configuration
    const VfsdConfig& getConfig() const;

    // Set configuration
    void setConfig(const VfsdConfig& config);

    // Add or replace a partition by name
    void setPartition(const std::string& name, const std::string& path);

    // Auto-detect file format
    static ConfigFormat detectFormat(const std::string& filename);

    // Validate configuration
    bool validate() const;

private:
    VfsdConfig config_;

    // Format-specific loaders
    bool loadIni(const std::string& filename);
    bool loadJson(const std::string& filename);
    bool loadYaml(const std::string& filename);

    // Format-specific savers
    bool saveIni(const std::string& filename) const;
    bool saveJson(const std::string& filename) const;
    bool saveYaml(const std::string& filename) const;

    // Helper methods
    std::string trim(const std::string& str) const;
    int stringToInt(const std::string& str) const;
    bool stringToBool(const std::string& str) const;
};

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_CONFIG_MANAGER_HPP
