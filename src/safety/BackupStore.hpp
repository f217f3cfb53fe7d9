/**
 * XmlGuard - Backup Store
 *
 * Versioned backups on disk:
 *
 *   <backupRoot>/<fileName>_backups/<fileName>.<yyyyMMdd_HHmmss>.bak
 *
 * A second backup within the same second gets a "-N" suffix on the
 * timestamp token. Each backup directory also holds index.json with the
 * id, original path, checksum and operation of every backup it contains.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <QByteArray>
#include <QMutex>

#include "SafetyRecords.hpp"

namespace xmlguard {

/**
 * SHA-256 of a byte sequence as lower-case hex
 */
std::string sha256Hex(const QByteArray& content);

/**
 * Backup creation, rotation and lookup
 *
 * Callers hold the per-path write lock of the original file; the store's own
 * mutex covers directories shared by files with the same name.
 */
class BackupStore {
public:
    static constexpr const char* TIMESTAMP_FORMAT = "yyyyMMdd_HHmmss";
    static constexpr const char* INDEX_FILE = "index.json";

    BackupStore(std::filesystem::path backupRoot, int maxVersions);

    /**
     * Store a backup of a file's current content and prune old versions
     *
     * @param originalPath Canonical path of the file being overwritten
     * @param content Bytes to back up
     * @param operation Tag of the operation that triggered the backup
     * @param warnings Receives pruning and index failures
     * @throws IOFailure if the backup itself cannot be written
     */
    BackupRecord createBackup(const std::filesystem::path& originalPath,
                              const QByteArray& content,
                              const std::string& operation,
                              std::vector<NonFatalIssue>& warnings);

    /**
     * Backups of a file, newest first
     */
    std::vector<BackupRecord> history(const std::filesystem::path& originalPath) const;

    /**
     * Find a backup by its timestamp token
     */
    std::optional<BackupRecord> find(const std::filesystem::path& originalPath,
                                     const std::string& timestampToken) const;

    /**
     * Every indexed backup under the backup root, newest first
     *
     * Backups missing from their directory index are skipped because their
     * original path is unknown.
     */
    std::vector<BackupRecord> allIndexedBackups() const;

    std::filesystem::path directoryFor(const std::filesystem::path& originalPath) const;

    const std::filesystem::path& root() const { return m_root; }
    int maxVersions() const { return m_maxVersions; }

private:
    struct IndexEntry {
        std::string id;
        std::string backupFile;
        std::string originalPath;
        std::string checksum;
        std::string operation;
    };

    std::vector<BackupRecord> listDirectory(const std::filesystem::path& directory,
                                            const std::string& fileName,
                                            const std::optional<std::filesystem::path>& originalFilter) const;

    void prune(const std::filesystem::path& directory,
               const std::filesystem::path& originalPath,
               std::vector<NonFatalIssue>& warnings);

    std::vector<IndexEntry> readIndex(const std::filesystem::path& directory,
                                      std::vector<NonFatalIssue>* warnings) const;
    void writeIndex(const std::filesystem::path& directory,
                    const std::vector<IndexEntry>& entries,
                    std::vector<NonFatalIssue>& warnings);

    mutable QMutex m_mutex;
    std::filesystem::path m_root;
    int m_maxVersions;
};

} // namespace xmlguard
