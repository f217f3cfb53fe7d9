/**
 * XmlGuard - Configuration Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"

#include <fstream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace xmlguard {

namespace {
    constexpr const char* CONFIG_FILE = "xmlguard.json";
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory,
                               const std::filesystem::path& dataDirectory) {
    m_configDirectory = configDirectory;
    m_dataDirectory = dataDirectory;
    m_programConfig = ProgramConfig{};
    m_safetyConfig = SafetyConfig{};
    m_validationConfig = ValidationConfig{};

    // Create directories if they don't exist
    try {
        std::filesystem::create_directories(m_configDirectory);
        std::filesystem::create_directories(m_dataDirectory);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create config directories: {}", e.what());
        return false;
    }

    // Check if this is first run
    m_isFirstRun = !std::filesystem::exists(configFile());

    if (!m_isFirstRun) {
        if (!loadConfig()) {
            spdlog::warn("Failed to load config, using defaults");
        }
    }

    spdlog::info("ConfigManager initialized at: {}", m_configDirectory.string());
    return true;
}

bool ConfigManager::save() {
    return saveConfig();
}

std::filesystem::path ConfigManager::configFile() const {
    return m_configDirectory / CONFIG_FILE;
}

void ConfigManager::setProgramConfig(const ProgramConfig& config) {
    m_programConfig = config;
    saveConfig();
}

SafetyConfig ConfigManager::safetyConfig() const {
    SafetyConfig config = m_safetyConfig;
    if (config.backupDirectory.is_relative()) {
        config.backupDirectory = m_dataDirectory / config.backupDirectory;
    }
    if (config.auditLogPath.is_relative()) {
        config.auditLogPath = m_dataDirectory / config.auditLogPath;
    }
    return config;
}

void ConfigManager::setSafetyConfig(const SafetyConfig& config) {
    m_safetyConfig = config;
    saveConfig();
}

void ConfigManager::setValidationConfig(const ValidationConfig& config) {
    m_validationConfig = config;
    saveConfig();
}

bool ConfigManager::loadConfig() {
    auto configPath = configFile();

    try {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            return false;
        }

        nlohmann::json j = nlohmann::json::parse(file);

        if (j.contains("logVerbosity")) {
            m_programConfig.logVerbosity = j["logVerbosity"].get<std::string>();
        }
        if (j.contains("safety")) {
            m_safetyConfig = SafetyConfig::fromJson(j["safety"].dump());
        }
        if (j.contains("validation")) {
            m_validationConfig = ValidationConfig::fromJson(j["validation"].dump());
        }

        spdlog::debug("Loaded config from {}", configPath.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::saveConfig() {
    auto configPath = configFile();

    try {
        nlohmann::json j;
        j["logVerbosity"] = m_programConfig.logVerbosity;
        j["safety"] = nlohmann::json::parse(m_safetyConfig.toJson());
        j["validation"] = nlohmann::json::parse(m_validationConfig.toJson());

        std::ofstream file(configPath);
        if (!file.is_open()) {
            spdlog::error("Failed to open {} for writing", configPath.string());
            return false;
        }
        file << j.dump(2);

        m_isFirstRun = false;
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

} // namespace xmlguard
