/**
 * @file config_manager.cpp
 * @brief Configuration management implementation for Simple VFS Daemon
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include "simple_vfsd/config_manager.hpp"
#include "simple_vfsd/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <json/json.h>
#include <yaml-cpp/yaml.h>

namespace SimpleVfsd {

VfsdConfig::VfsdConfig()
    : verbose(false)
    , watch(true)
    , poll_interval_ms(500)
    , pid_file("/var/run/simple-vfsd/simple-vfsd.pid")
    , log_level("info")
    , log_file("") {
}

ConfigManager::ConfigManager() {
}

ConfigManager::~ConfigManager() {
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    if (filename.empty()) {
        Logger::error("No configuration file given");
        return false;
    }

    ConfigFormat format = detectFormat(filename);

    switch (format) {
        case ConfigFormat::INI:
            return loadIni(filename);
        case ConfigFormat::JSON:
            return loadJson(filename);
        case ConfigFormat::YAML:
            return loadYaml(filename);
        default:
            Logger::error("Unknown configuration format for file: " + filename);
            return false;
    }
}

bool ConfigManager::saveToFile(const std::string& filename, ConfigFormat format) const {
    switch (format) {
        case ConfigFormat::INI:
            return saveIni(filename);
        case ConfigFormat::JSON:
            return saveJson(filename);
        case ConfigFormat::YAML:
            return saveYaml(filename);
        default:
            Logger::error("Unknown configuration format: " + std::to_string(static_cast<int>(format)));
            return false;
    }
}

const VfsdConfig& ConfigManager::getConfig() const {
    return config_;
}

void ConfigManager::setConfig(const VfsdConfig& config) {
    config_ = config;
}

void ConfigManager::setPartition(const std::string& name, const std::string& path) {
    for (auto& partition : config_.partitions) {
        if (partition.name == name) {
            partition.path = path;
            return;
        }
    }
    config_.partitions.push_back(VfsdConfig::Partition{name, path});
}

ConfigFormat ConfigManager::detectFormat(const std::string& filename) {
    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos) {
        return ConfigFormat::INI;
    }

    std::string extension = filename.substr(dot + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);

    if (extension == "json") {
        return ConfigFormat::JSON;
    } else if (extension == "yaml" || extension == "yml") {
        return ConfigFormat::YAML;
    } else {
        return ConfigFormat::INI;
    }
}

bool ConfigManager::validate() const {
    LogLevel level;
    if (!Logger::parseLevel(config_.log_level, level)) {
        Logger::error("Invalid log level: " + config_.log_level);
        return false;
    }

    if (config_.poll_interval_ms < 1) {
        Logger::error("Invalid poll interval: " + std::to_string(config_.poll_interval_ms));
        return false;
    }

    for (size_t i = 0; i < config_.partitions.size(); ++i) {
        const auto& partition = config_.partitions[i];

        if (partition.name.empty() || partition.name.find('/') != std::string::npos) {
            Logger::error("Invalid partition name: '" + partition.name + "'");
            return false;
        }

        if (!std::filesystem::path(partition.path).is_absolute()) {
            Logger::error("Partition '" + partition.name + "' path is not absolute: " + partition.path);
            return false;
        }

        for (size_t j = i + 1; j < config_.partitions.size(); ++j) {
            if (config_.partitions[j].name == partition.name) {
                Logger::error("Duplicate partition: " + partition.name);
                return false;
            }
        }
    }

    return true;
}

bool ConfigManager::loadIni(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::error("Failed to open configuration file: " + filename);
        return false;
    }

    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section headers
        if (line[0] == '[' && line[line.length() - 1] == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        // Parse key-value pairs
        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));

        if (current_section == "global") {
            if (key == "verbose") {
                config_.verbose = stringToBool(value);
            } else if (key == "watch") {
                config_.watch = stringToBool(value);
            } else if (key == "poll_interval_ms") {
                config_.poll_interval_ms = stringToInt(value);
            } else if (key == "pid_file") {
                config_.pid_file = value;
            } else if (key == "log_level") {
                config_.log_level = value;
            } else if (key == "log_file") {
                config_.log_file = value;
            }
        } else if (current_section == "partitions") {
            setPartition(key, value);
        }
    }

    return true;
}

bool ConfigManager::loadJson(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::error("Failed to open configuration file: " + filename);
        return false;
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;

    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        Logger::error("Failed to parse JSON configuration: " + errors);
        return false;
    }

    if (!root.isObject()) {
        Logger::error("JSON configuration must be an object: " + filename);
        return false;
    }

    try {
        // Parse global settings
        if (root.isMember("global")) {
            const Json::Value& global = root["global"];

            if (global.isMember("verbose")) {
                config_.verbose = global["verbose"].asBool();
            }
            if (global.isMember("watch")) {
                config_.watch = global["watch"].asBool();
            }
            if (global.isMember("poll_interval_ms")) {
                config_.poll_interval_ms = global["poll_interval_ms"].asInt();
            }
            if (global.isMember("pid_file")) {
                config_.pid_file = global["pid_file"].asString();
            }
            if (global.isMember("log_level")) {
                config_.log_level = global["log_level"].asString();
            }
            if (global.isMember("log_file")) {
                config_.log_file = global["log_file"].asString();
            }
        }

        // Parse partitions
        if (root.isMember("partitions")) {
            const Json::Value& partitions = root["partitions"];
            config_.partitions.clear();

            for (const auto& name : partitions.getMemberNames()) {
                setPartition(name, partitions[name].asString());
            }
        }
    } catch (const Json::Exception& e) {
        Logger::error(std::string("Invalid JSON configuration: ") + e.what());
        return false;
    }

    return true;
}

bool ConfigManager::loadYaml(const std::string& filename) {
    try {
        YAML::Node config = YAML::LoadFile(filename);

        // Parse global settings
        if (config["global"]) {
            const YAML::Node& global = config["global"];

            if (global["verbose"]) {
                config_.verbose = global["verbose"].as<bool>();
            }
            if (global["watch"]) {
                config_.watch = global["watch"].as<bool>();
            }
            if (global["poll_interval_ms"]) {
                config_.poll_interval_ms = global["poll_interval_ms"].as<int>();
            }
            if (global["pid_file"]) {
                config_.pid_file = global["pid_file"].as<std::string>();
            }
            if (global["log_level"]) {
                config_.log_level = global["log_level"].as<std::string>();
            }
            if (global["log_file"]) {
                config_.log_file = global["log_file"].as<std::string>();
            }
        }

        // Parse partitions
        if (config["partitions"]) {
            const YAML::Node& partitions = config["partitions"];
            config_.partitions.clear();

            for (const auto& entry : partitions) {
                setPartition(entry.first.as<std::string>(), entry.second.as<std::string>());
            }
        }

        return true;
    } catch (const YAML::Exception& e) {
        Logger::error(std::string("Failed to parse YAML configuration: ") + e.what());
        return false;
    }
}

bool ConfigManager::saveIni(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        Logger::error("Failed to create configuration file: " + filename);
        return false;
    }

    file << "# Simple VFS Daemon Configuration File" << std::endl;
    file << "# Copyright 2024 SimpleDaemons" << std::endl;
    file << std::endl;

    // Global settings
    file << "[global]" << std::endl;
    file << "verbose = " << (config_.verbose ? "true" : "false") << std::endl;
    file << "watch = " << (config_.watch ? "true" : "false") << std::endl;
    file << "poll_interval_ms = " << config_.poll_interval_ms << std::endl;
    file << "pid_file = " << config_.pid_file << std::endl;
    file << "log_level = " << config_.log_level << std::endl;
    file << "log_file = " << config_.log_file << std::endl;
    file << std::endl;

    // Partitions
    if (!config_.partitions.empty()) {
        file << "[partitions]" << std::endl;
        for (const auto& partition : config_.partitions) {
            file << partition.name << " = " << partition.path << std::endl;
        }
    }

    return file.good();
}

bool ConfigManager::saveJson(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        Logger::error("Failed to create configuration file: " + filename);
        return false;
    }

    Json::Value root;

    // Global settings
    Json::Value global;
    global["verbose"] = config_.verbose;
    global["watch"] = config_.watch;
    global["poll_interval_ms"] = config_.poll_interval_ms;
    global["pid_file"] = config_.pid_file;
    global["log_level"] = config_.log_level;
    global["log_file"] = config_.log_file;

    root["global"] = global;

    // Partitions
    Json::Value partitions(Json::objectValue);
    for (const auto& partition : config_.partitions) {
        partitions[partition.name] = partition.path;
    }
    root["partitions"] = partitions;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &file);

    return file.good();
}

bool ConfigManager::saveYaml(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        Logger::error("Failed to create configuration file: " + filename);
        return false;
    }

    YAML::Node root;

    // Global settings
    YAML::Node global;
    global["verbose"] = config_.verbose;
    global["watch"] = config_.watch;
    global["poll_interval_ms"] = config_.poll_interval_ms;
    global["pid_file"] = config_.pid_file;
    global["log_level"] = config_.log_level;
    global["log_file"] = config_.log_file;

    root["global"] = global;

    // Partitions
    YAML::Node partitions(YAML::NodeType::Map);
    for (const auto& partition : config_.partitions) {
        partitions[partition.name] = partition.path;
    }
    root["partitions"] = partitions;

    file << root;

    return file.good();
}

std::string ConfigManager::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r");
    return str.substr(first, (last - first + 1));
}

int ConfigManager::stringToInt(const std::string& str) const {
    try {
        return std::stoi(str);
    } catch (const std::exception&) {
        return 0;
    }
}

bool ConfigManager::stringToBool(const std::string& str) const {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

} // namespace SimpleVfsd
