/**
 * XmlGuard - File Safety Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "FileSafetyManager.hpp"
#include "AtomicFile.hpp"

#include <algorithm>
#include <system_error>

#include <QMutexLocker>
#include <QReadLocker>
#include <QWriteLocker>

#include <spdlog/spdlog.h>

namespace xmlguard {

namespace {

/**
 * Write locks on several paths, taken in the given order and released in
 * reverse
 */
class WriteLockSet {
public:
    explicit WriteLockSet(std::vector<QReadWriteLock*> locks)
        : m_locks(std::move(locks))
    {
        for (auto* lock : m_locks) {
            lock->lockForWrite();
        }
    }

    ~WriteLockSet() {
        for (auto it = m_locks.rbegin(); it != m_locks.rend(); ++it) {
            (*it)->unlock();
        }
    }

    WriteLockSet(const WriteLockSet&) = delete;
    WriteLockSet& operator=(const WriteLockSet&) = delete;

private:
    std::vector<QReadWriteLock*> m_locks;
};

bool fileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // anonymous namespace

FileSafetyManager::FileSafetyManager(SafetyConfig config)
    : m_config(std::move(config))
    , m_defaultActor(m_config.resolvedActor())
    , m_checker(m_config.maxFileSize)
    , m_backups(m_config.backupDirectory, m_config.maxBackupVersions)
    , m_audit(m_config.auditLogPath)
{
    spdlog::info("File safety manager started (backups: {}, keep {} versions, audit: {})",
                 m_config.backupDirectory.string(), m_backups.maxVersions(),
                 m_config.auditLogPath.string());

    AuditRecord record;
    record.operation = "SYSTEM_START";
    record.actor = m_defaultActor;
    record.metadata["backupDirectory"] = m_config.backupDirectory.string();
    audit(std::move(record), nullptr);
}

FileSafetyManager::~FileSafetyManager() {
    {
        QMutexLocker lock(&m_activeMutex);
        for (auto& [actor, txn] : m_activeByActor) {
            spdlog::warn("Discarding uncommitted transaction {} of {}", txn->id(), actor);
            txn->setStatus(TransactionStatus::RolledBack);
        }
        m_activeByActor.clear();
    }

    AuditRecord record;
    record.operation = "SYSTEM_SHUTDOWN";
    record.actor = m_defaultActor;
    audit(std::move(record), nullptr);
}

std::filesystem::path FileSafetyManager::canonicalPath(const std::filesystem::path& path) const {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal();
    }

    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal();
    }
    return canonical;
}

QReadWriteLock* FileSafetyManager::lockFor(const std::filesystem::path& canonical) {
    QMutexLocker lock(&m_lockMapMutex);
    auto& slot = m_pathLocks[canonical];
    if (!slot) {
        slot = std::make_unique<QReadWriteLock>();
    }
    return slot.get();
}

std::string FileSafetyManager::actorOrDefault(const std::string& actor) const {
    return actor.empty() ? m_defaultActor : actor;
}

TransactionPtr FileSafetyManager::beginTransaction(const std::string& description,
                                                   const std::string& actor) {
    const auto owner = actorOrDefault(actor);
    TransactionPtr txn;

    {
        QMutexLocker lock(&m_activeMutex);
        auto it = m_activeByActor.find(owner);
        if (it != m_activeByActor.end()) {
            throw TransactionAlreadyActive(owner, it->second->id());
        }
        txn = std::make_shared<Transaction>(description, owner);
        m_activeByActor.emplace(owner, txn);
    }

    spdlog::info("Transaction {} started by {}: {}", txn->id(), owner, description);

    AuditRecord record;
    record.operation = "BEGIN_TRANSACTION";
    record.actor = owner;
    record.transactionId = txn->id();
    record.metadata["description"] = description;
    audit(std::move(record), nullptr);

    return txn;
}

TransactionPtr FileSafetyManager::activeTransaction(const std::string& actor) const {
    QMutexLocker lock(&m_activeMutex);
    auto it = m_activeByActor.find(actorOrDefault(actor));
    return it != m_activeByActor.end() ? it->second : nullptr;
}

void FileSafetyManager::requireActive(const TransactionPtr& txn, const char* operation) const {
    QMutexLocker lock(&m_activeMutex);
    auto it = m_activeByActor.find(txn->actor());
    if (it == m_activeByActor.end() || it->second != txn || !txn->isActive()) {
        throw NoActiveTransaction(std::string("Cannot ") + operation + ": transaction " +
                                  txn->id() + " is " +
                                  transactionStatusToString(txn->status()) +
                                  " or not owned by this manager");
    }
}

void FileSafetyManager::claim(const TransactionPtr& txn, const char* operation) {
    if (!txn) {
        throw NoActiveTransaction(std::string("Cannot ") + operation + ": no transaction given");
    }

    requireActive(txn, operation);

    QMutexLocker lock(&m_activeMutex);
    auto it = m_activeByActor.find(txn->actor());
    if (it == m_activeByActor.end() || it->second != txn) {
        throw NoActiveTransaction(std::string("Cannot ") + operation + ": transaction " +
                                  txn->id() + " was finished concurrently");
    }
    m_activeByActor.erase(it);
}

QByteArray FileSafetyManager::safeRead(const std::filesystem::path& path,
                                       const TransactionPtr& txn) {
    const auto canonical = canonicalPath(path);
    if (txn) {
        requireActive(txn, "read");
    }

    QByteArray content;
    {
        QReadLocker lock(lockFor(canonical));
        content = fileio::readAll(canonical);
    }

    if (txn && txn->captureOriginal(canonical, content)) {
        txn->logOperation("READ: " + canonical.string());
    }
    return content;
}

OperationOutcome FileSafetyManager::safeWrite(const std::filesystem::path& path,
                                              const QByteArray& content,
                                              const TransactionPtr& txn) {
    const auto canonical = canonicalPath(path);
    OperationOutcome outcome;

    if (txn) {
        requireActive(txn, "write");

        if (!txn->hasOriginal(canonical)) {
            std::optional<QByteArray> original;
            {
                QReadLocker lock(lockFor(canonical));
                if (fileExists(canonical)) {
                    original = fileio::readAll(canonical);
                }
            }
            txn->captureOriginal(canonical, std::move(original));
        }

        txn->stage(canonical, content);
        spdlog::debug("Staged {} bytes for {} in transaction {}",
                      content.size(), canonical.string(), txn->id());

        outcome.affectedPaths.push_back(canonical);
        return outcome;
    }

    AuditRecord record;
    record.operation = "WRITE";
    record.filePath = canonical.string();
    record.actor = m_defaultActor;

    try {
        auto result = m_checker.check(content);
        if (!result.valid) {
            spdlog::error("Refusing to write {}: {}", canonical.string(), result.summary());
            throw DataIntegrityError(canonical, std::move(result));
        }

        QWriteLocker lock(lockFor(canonical));
        backupAndWrite(canonical, content, "WRITE", outcome);
    } catch (const SafetyError& e) {
        record.success = false;
        record.errorMessage = e.what();
        audit(std::move(record), nullptr);
        throw;
    }

    record.metadata["size"] = std::to_string(content.size());
    audit(std::move(record), &outcome.warnings);

    outcome.affectedPaths.push_back(canonical);
    return outcome;
}

void FileSafetyManager::backupAndWrite(const std::filesystem::path& canonical,
                                       const QByteArray& content,
                                       const std::string& operation,
                                       OperationOutcome& outcome) {
    if (fileExists(canonical)) {
        auto current = fileio::readAll(canonical);
        outcome.backups.push_back(
            m_backups.createBackup(canonical, current, operation, outcome.warnings));
    }

    fileio::atomicWrite(canonical, content);
    spdlog::debug("Wrote {} ({} bytes)", canonical.string(), content.size());
}

OperationOutcome FileSafetyManager::commitTransaction(const TransactionPtr& txn) {
    claim(txn, "commit");

    OperationOutcome outcome;
    const auto staged = txn->stagedSnapshot();

    std::vector<std::filesystem::path> paths;
    paths.reserve(staged.size());
    for (const auto& entry : staged) {
        paths.push_back(entry.path);
    }

    auto lockOrder = paths;
    std::sort(lockOrder.begin(), lockOrder.end());
    std::vector<QReadWriteLock*> locks;
    locks.reserve(lockOrder.size());
    for (const auto& path : lockOrder) {
        locks.push_back(lockFor(path));
    }
    WriteLockSet held(std::move(locks));

    auto recordFailure = [&](const std::string& error) {
        txn->setStatus(TransactionStatus::Failed);
        txn->logOperation("COMMIT FAILED: " + error);

        AuditRecord record;
        record.operation = "COMMIT_TRANSACTION";
        record.actor = txn->actor();
        record.success = false;
        record.errorMessage = error;
        record.transactionId = txn->id();
        audit(std::move(record), nullptr);

        for (const auto& warning : outcome.warnings) {
            spdlog::warn("{} {}: {}", warning.operation, warning.path, warning.message);
        }
    };

    // Every staged sequence is checked before the first byte reaches disk
    for (const auto& entry : staged) {
        auto result = m_checker.check(entry.content);
        if (!result.valid) {
            spdlog::error("Transaction {} rejected, {} failed integrity: {}",
                          txn->id(), entry.path.string(), result.summary());
            restoreOriginals(*txn, paths, outcome.warnings);
            DataIntegrityError error(entry.path, std::move(result));
            recordFailure(error.what());
            throw error;
        }
    }

    try {
        for (const auto& entry : staged) {
            backupAndWrite(entry.path, entry.content, "COMMIT", outcome);
        }
    } catch (const SafetyError& e) {
        spdlog::error("Transaction {} failed during commit: {}", txn->id(), e.what());
        restoreOriginals(*txn, paths, outcome.warnings);
        recordFailure(e.what());
        throw;
    }

    txn->setStatus(TransactionStatus::Committed);
    txn->logOperation("COMMIT");
    spdlog::info("Transaction {} committed ({} files)", txn->id(), paths.size());

    AuditRecord record;
    record.operation = "COMMIT_TRANSACTION";
    record.actor = txn->actor();
    record.transactionId = txn->id();
    record.metadata["files"] = std::to_string(paths.size());
    audit(std::move(record), &outcome.warnings);

    outcome.affectedPaths = std::move(paths);
    return outcome;
}

OperationOutcome FileSafetyManager::rollbackTransaction(const TransactionPtr& txn) {
    claim(txn, "rollback");

    OperationOutcome outcome;
    std::vector<std::filesystem::path> paths;
    for (const auto& [path, original] : txn->originalsSnapshot()) {
        paths.push_back(path);
    }

    {
        std::vector<QReadWriteLock*> locks;
        locks.reserve(paths.size());
        for (const auto& path : paths) {
            locks.push_back(lockFor(path));
        }
        WriteLockSet held(std::move(locks));
        restoreOriginals(*txn, paths, outcome.warnings);
    }

    txn->setStatus(TransactionStatus::RolledBack);
    txn->logOperation("ROLLBACK");
    spdlog::info("Transaction {} rolled back ({} restore failures)",
                 txn->id(), outcome.warnings.size());

    AuditRecord record;
    record.operation = "ROLLBACK_TRANSACTION";
    record.actor = txn->actor();
    record.transactionId = txn->id();
    record.metadata["restoreFailures"] = std::to_string(outcome.warnings.size());
    audit(std::move(record), &outcome.warnings);

    outcome.affectedPaths = std::move(paths);
    return outcome;
}

void FileSafetyManager::restoreOriginals(const Transaction& txn,
                                         const std::vector<std::filesystem::path>& paths,
                                         std::vector<NonFatalIssue>& warnings) {
    const auto originals = txn.originalsSnapshot();
    for (const auto& path : paths) {
        auto it = originals.find(path);
        if (it == originals.end()) {
            continue;
        }
        restoreOne(path, it->second, txn.stagedContent(path), warnings);
    }
}

void FileSafetyManager::restoreOne(const std::filesystem::path& path,
                                   const Transaction::Original& original,
                                   const std::optional<QByteArray>& staged,
                                   std::vector<NonFatalIssue>& warnings) {
    try {
        if (!original.existed) {
            // Only remove what this transaction put there
            if (!fileExists(path) || !staged || fileio::readAll(path) != *staged) {
                return;
            }
            std::error_code ec;
            if (!std::filesystem::remove(path, ec) && ec) {
                throw IOFailure("Remove created file", path, ec.message());
            }
            spdlog::info("Removed {} created by the transaction", path.string());
            return;
        }

        if (fileExists(path) && fileio::readAll(path) == original.content) {
            return;
        }
        fileio::atomicWrite(path, original.content);
        spdlog::info("Restored original content of {}", path.string());
    } catch (const SafetyError& e) {
        spdlog::error("Failed to restore {}: {}", path.string(), e.what());
        warnings.push_back({"RESTORE", path.string(), e.what()});
    }
}

OperationOutcome FileSafetyManager::restoreFromBackup(const std::filesystem::path& path,
                                                      const std::string& timestampToken) {
    const auto canonical = canonicalPath(path);
    OperationOutcome outcome;

    AuditRecord record;
    record.operation = "RESTORE";
    record.filePath = canonical.string();
    record.actor = m_defaultActor;
    record.metadata["backup"] = timestampToken;

    try {
        auto backup = m_backups.find(canonical, timestampToken);
        if (!backup) {
            throw NotFoundError(m_backups.directoryFor(canonical) /
                                (canonical.filename().string() + "." + timestampToken + ".bak"));
        }

        auto content = fileio::readAll(backup->backupPath);
        auto result = m_checker.check(content);
        if (!result.valid) {
            throw DataIntegrityError(backup->backupPath, std::move(result));
        }

        QWriteLocker lock(lockFor(canonical));
        backupAndWrite(canonical, content, "RESTORE", outcome);
    } catch (const SafetyError& e) {
        spdlog::error("Restore of {} from {} failed: {}", canonical.string(), timestampToken, e.what());
        record.success = false;
        record.errorMessage = e.what();
        audit(std::move(record), nullptr);
        throw;
    }

    spdlog::info("Restored {} from backup {}", canonical.string(), timestampToken);
    audit(std::move(record), &outcome.warnings);

    outcome.affectedPaths.push_back(canonical);
    return outcome;
}

std::vector<BackupRecord> FileSafetyManager::getBackupHistory(const std::filesystem::path& path) const {
    return m_backups.history(canonicalPath(path));
}

IntegrityCheckResult FileSafetyManager::validateXmlIntegrity(const QByteArray& content) const {
    return m_checker.check(content);
}

OperationOutcome FileSafetyManager::executeBatch(const std::string& description,
                                                 const std::vector<std::filesystem::path>& paths,
                                                 const BatchOperation& operation,
                                                 const std::string& actor) {
    auto txn = beginTransaction(description, actor);

    try {
        for (const auto& path : paths) {
            operation(path, txn);
        }
    } catch (const std::exception& e) {
        spdlog::error("Batch '{}' failed: {}", description, e.what());
        if (txn->isActive()) {
            rollbackTransaction(txn);
        }
        throw;
    }

    return commitTransaction(txn);
}

OperationOutcome FileSafetyManager::emergencyRollback(const QDateTime& timepoint) {
    OperationOutcome outcome;

    // Newest first, so the first backup at or before the timepoint wins
    std::map<std::filesystem::path, std::string> targets;
    for (const auto& backup : m_backups.allIndexedBackups()) {
        if (backup.timestamp <= timepoint) {
            targets.emplace(backup.originalPath, backup.timestampToken);
        }
    }

    spdlog::warn("Emergency rollback to {}: {} files",
                 timepoint.toString(BackupStore::TIMESTAMP_FORMAT).toStdString(), targets.size());

    for (const auto& [path, token] : targets) {
        try {
            outcome.merge(restoreFromBackup(path, token));
        } catch (const SafetyError& e) {
            outcome.warnings.push_back({"EMERGENCY_ROLLBACK", path.string(), e.what()});
        }
    }

    AuditRecord record;
    record.operation = "EMERGENCY_ROLLBACK";
    record.actor = m_defaultActor;
    record.success = outcome.warnings.empty();
    record.metadata["timepoint"] = timepoint.toString(BackupStore::TIMESTAMP_FORMAT).toStdString();
    record.metadata["restored"] = std::to_string(outcome.affectedPaths.size());
    audit(std::move(record), &outcome.warnings);

    return outcome;
}

void FileSafetyManager::audit(AuditRecord record, std::vector<NonFatalIssue>* warnings) {
    auto issue = m_audit.append(record);
    if (issue && warnings) {
        warnings->push_back(std::move(*issue));
    }
}

} // namespace xmlguard
