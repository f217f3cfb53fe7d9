/**
 * XmlGuard - Platform Abstraction
 *
 * Per-user directories and the identity recorded in the audit trail.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

namespace xmlguard {

/**
 * Platform abstraction layer
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     *
     * Linux:   ~/.config/xmlguard/
     */
    static std::filesystem::path getConfigPath();

    /**
     * Get the data directory path (backups, audit log)
     *
     * Linux:   ~/.local/share/xmlguard/
     */
    static std::filesystem::path getDataPath();

    /**
     * Directory for the diagnostic log files
     */
    static std::filesystem::path getLogPath();

    /**
     * Login name of the user running the process, "unknown" if unavailable
     */
    static std::string currentUserName();
};

} // namespace xmlguard
