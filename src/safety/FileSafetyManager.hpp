/**
 * XmlGuard - File Safety Manager
 *
 * The only gateway for reading and writing game data files. Every write is
 * integrity-checked, backed up and applied atomically; batches of writes go
 * through explicit transactions that commit all-or-nothing.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QByteArray>
#include <QDateTime>
#include <QMutex>
#include <QReadWriteLock>

#include "AuditLog.hpp"
#include "BackupStore.hpp"
#include "IntegrityChecker.hpp"
#include "SafetyErrors.hpp"
#include "SafetyRecords.hpp"
#include "Transaction.hpp"
#include "core/config/SafetyConfig.hpp"

namespace xmlguard {

/**
 * Safe file access with transactions, backups and an audit trail
 *
 * Locking: one read/write lock per canonical path, created on first use and
 * kept for the lifetime of the manager. Commits take the write locks of all
 * staged paths in sorted order, so transactions on disjoint files commit in
 * parallel and transactions sharing a file serialize.
 *
 * Transactions are explicit handles. Each actor may own at most one active
 * transaction at a time.
 */
class FileSafetyManager {
public:
    using BatchOperation =
        std::function<void(const std::filesystem::path&, const TransactionPtr&)>;

    explicit FileSafetyManager(SafetyConfig config);
    ~FileSafetyManager();

    FileSafetyManager(const FileSafetyManager&) = delete;
    FileSafetyManager& operator=(const FileSafetyManager&) = delete;

    /**
     * Start a transaction
     *
     * @param actor Owner of the transaction; empty uses the configured default
     * @throws TransactionAlreadyActive if the actor already owns one
     */
    TransactionPtr beginTransaction(const std::string& description,
                                    const std::string& actor = {});

    /**
     * Read a file under its shared lock
     *
     * The first touch of a path inside a transaction records its bytes as
     * the path's original.
     *
     * @throws NotFoundError, IOFailure, NoActiveTransaction
     */
    QByteArray safeRead(const std::filesystem::path& path,
                        const TransactionPtr& txn = nullptr);

    /**
     * Write a file
     *
     * With an active transaction the bytes are only staged. Without one the
     * content is integrity-checked, the existing file is backed up and the
     * new content is written atomically.
     *
     * @throws DataIntegrityError, IOFailure, NoActiveTransaction
     */
    OperationOutcome safeWrite(const std::filesystem::path& path,
                               const QByteArray& content,
                               const TransactionPtr& txn = nullptr);

    /**
     * Apply every staged write, all or nothing
     *
     * @throws DataIntegrityError if any staged content fails the integrity
     *         check (nothing is written)
     * @throws IOFailure if a backup or write fails (everything written so far
     *         is restored)
     * @throws NoActiveTransaction
     */
    OperationOutcome commitTransaction(const TransactionPtr& txn);

    /**
     * Abandon a transaction and put its touched files back as they were
     *
     * Files the transaction created are removed. Restore failures are
     * reported as warnings and do not stop the remaining paths.
     *
     * @throws NoActiveTransaction
     */
    OperationOutcome rollbackTransaction(const TransactionPtr& txn);

    /**
     * Replace a file with one of its backups
     *
     * The current content is backed up first, so a restore can be undone.
     *
     * @param timestampToken Backup timestamp as in its file name (yyyyMMdd_HHmmss[-N])
     * @throws NotFoundError, DataIntegrityError, IOFailure
     */
    OperationOutcome restoreFromBackup(const std::filesystem::path& path,
                                       const std::string& timestampToken);

    /**
     * Backups of a file, newest first
     */
    std::vector<BackupRecord> getBackupHistory(const std::filesystem::path& path) const;

    IntegrityCheckResult validateXmlIntegrity(const QByteArray& content) const;

    /**
     * Run an operation for each path inside one transaction and commit it
     *
     * If an operation throws, the transaction is rolled back and the error
     * is rethrown.
     */
    OperationOutcome executeBatch(const std::string& description,
                                  const std::vector<std::filesystem::path>& paths,
                                  const BatchOperation& operation,
                                  const std::string& actor = {});

    /**
     * Restore every backed-up file to its newest backup taken at or before
     * the given time
     *
     * affectedPaths lists the restored files; per-file failures are warnings.
     */
    OperationOutcome emergencyRollback(const QDateTime& timepoint);

    /**
     * Active transaction of an actor, or nullptr
     */
    TransactionPtr activeTransaction(const std::string& actor = {}) const;

    const SafetyConfig& config() const { return m_config; }
    const std::filesystem::path& auditLogPath() const { return m_audit.path(); }
    std::filesystem::path canonicalPath(const std::filesystem::path& path) const;

private:
    QReadWriteLock* lockFor(const std::filesystem::path& canonical);
    std::string actorOrDefault(const std::string& actor) const;

    void requireActive(const TransactionPtr& txn, const char* operation) const;

    // Removes the transaction from its actor; throws if it was not active
    void claim(const TransactionPtr& txn, const char* operation);

    // Caller holds the write lock of every path in the list
    void restoreOriginals(const Transaction& txn,
                          const std::vector<std::filesystem::path>& paths,
                          std::vector<NonFatalIssue>& warnings);
    void restoreOne(const std::filesystem::path& path,
                    const Transaction::Original& original,
                    const std::optional<QByteArray>& staged,
                    std::vector<NonFatalIssue>& warnings);

    // Caller holds the path's write lock
    void backupAndWrite(const std::filesystem::path& canonical,
                        const QByteArray& content,
                        const std::string& operation,
                        OperationOutcome& outcome);

    void audit(AuditRecord record, std::vector<NonFatalIssue>* warnings);

    SafetyConfig m_config;
    std::string m_defaultActor;
    IntegrityChecker m_checker;
    BackupStore m_backups;
    AuditLog m_audit;

    QMutex m_lockMapMutex;
    std::map<std::filesystem::path, std::unique_ptr<QReadWriteLock>> m_pathLocks;

    mutable QMutex m_activeMutex;
    std::map<std::string, TransactionPtr> m_activeByActor;
};

} // namespace xmlguard
