/**
 * XmlGuard - Configuration Manager
 *
 * Loads and saves xmlguard.json in the configuration directory.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

#include "SafetyConfig.hpp"
#include "ValidationConfig.hpp"

namespace xmlguard {

/**
 * Program-wide settings
 */
struct ProgramConfig {
    std::string logVerbosity = "info";             // debug, info, warning, error
};

/**
 * Central configuration manager
 *
 * Handles loading, saving, and providing access to all configuration data.
 * Relative backup and audit paths in the file are resolved against the
 * data directory given to initialize().
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory,
                    const std::filesystem::path& dataDirectory);
    bool save();

    // State queries
    bool isFirstRun() const { return m_isFirstRun; }
    const std::filesystem::path& configDirectory() const { return m_configDirectory; }
    std::filesystem::path configFile() const;

    const ProgramConfig& programConfig() const { return m_programConfig; }
    void setProgramConfig(const ProgramConfig& config);

    /**
     * Safety settings with relative paths resolved against the data directory
     */
    SafetyConfig safetyConfig() const;
    void setSafetyConfig(const SafetyConfig& config);

    const ValidationConfig& validationConfig() const { return m_validationConfig; }
    void setValidationConfig(const ValidationConfig& config);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadConfig();
    bool saveConfig();

    std::filesystem::path m_configDirectory;
    std::filesystem::path m_dataDirectory;
    bool m_isFirstRun = true;

    ProgramConfig m_programConfig;
    SafetyConfig m_safetyConfig;
    ValidationConfig m_validationConfig;
};

} // namespace xmlguard
