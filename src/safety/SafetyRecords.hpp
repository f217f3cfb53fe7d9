/**
 * XmlGuard - Safety Records
 *
 * Plain records produced by the file safety layer: backups, audit entries,
 * integrity results and the non-fatal issue channel.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <QDateTime>

namespace xmlguard {

/**
 * One stored backup of a file
 */
struct BackupRecord {
    std::string id;                        // UUID, empty when the index lost it
    QDateTime timestamp;                   // Second resolution, from the file name
    std::filesystem::path originalPath;
    std::filesystem::path backupPath;
    std::string checksum;                  // SHA-256, lower-case hex
    std::uint64_t size = 0;
    std::string operation;                 // WRITE, COMMIT, RESTORE

    /**
     * Timestamp token as it appears in the backup file name
     * (yyyyMMdd_HHmmss, optionally followed by -N)
     */
    std::string timestampToken;
};

/**
 * One line of the audit trail
 */
struct AuditRecord {
    QDateTime timestamp = QDateTime::currentDateTime();
    std::string operation;
    std::optional<std::string> filePath;
    std::string actor;
    bool success = true;
    std::optional<std::string> errorMessage;
    std::optional<std::string> transactionId;
    std::map<std::string, std::string> metadata;

    /**
     * Render as a single human-readable line
     */
    std::string toLine() const;
};

/**
 * Result of a structural XML check
 *
 * Every check runs, so one result lists every problem found.
 */
struct IntegrityCheckResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::map<std::string, std::string> details;

    void addError(const std::string& error) {
        valid = false;
        errors.push_back(error);
    }

    /**
     * All violations joined with "; "
     */
    std::string summary() const;
};

/**
 * A secondary failure that did not abort the primary operation
 */
struct NonFatalIssue {
    std::string operation;   // e.g. AUDIT, PRUNE_BACKUPS, RESTORE
    std::string path;
    std::string message;
};

/**
 * Outcome of a successful safety operation
 *
 * Carries whatever went wrong on the side (audit, pruning, best-effort
 * restores) so callers can tell a clean success from a degraded one.
 */
struct OperationOutcome {
    std::vector<NonFatalIssue> warnings;
    std::vector<BackupRecord> backups;
    std::vector<std::filesystem::path> affectedPaths;

    bool degraded() const { return !warnings.empty(); }

    void merge(OperationOutcome&& other);
};

} // namespace xmlguard
