/**
 * XmlGuard - Safety Configuration
 *
 * Settings of the file safety layer: where backups and the audit trail
 * live, how many backups are kept, and the size bound for XML content.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace xmlguard {

/**
 * File safety settings
 */
struct SafetyConfig {
    std::filesystem::path backupDirectory = "backup";
    std::filesystem::path auditLogPath = "audit.log";
    int maxBackupVersions = 10;
    std::uint64_t maxFileSize = 100ull * 1024 * 1024;    // 100 MB

    // Actor used when a caller does not name one; empty means the OS user
    std::string defaultActor;

    /**
     * Effective default actor (defaultActor or the current user name)
     */
    std::string resolvedActor() const;

    // Serialization
    static SafetyConfig fromJson(const std::string& json);
    std::string toJson() const;
};

} // namespace xmlguard
