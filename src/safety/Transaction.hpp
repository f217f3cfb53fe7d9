/**
 * XmlGuard - Transaction
 *
 * A batch of staged file writes that the FileSafetyManager applies all at
 * once or not at all. Callers receive a handle from beginTransaction() and
 * pass it explicitly to every read, write, commit and rollback.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QByteArray>
#include <QDateTime>
#include <QMutex>

namespace xmlguard {

/**
 * Transaction lifecycle state
 */
enum class TransactionStatus {
    Active,
    Committed,
    RolledBack,
    Failed
};

/**
 * Convert a transaction status to its display name
 */
std::string transactionStatusToString(TransactionStatus status);

/**
 * Staged writes and captured originals for one logical caller
 *
 * Originals are captured on first touch only. A path that did not exist at
 * first touch is recorded as such, so rollback can remove what the
 * transaction created.
 */
class Transaction {
public:
    Transaction(std::string description, std::string actor);

    const std::string& id() const { return m_id; }
    const std::string& description() const { return m_description; }
    const std::string& actor() const { return m_actor; }
    const QDateTime& startTime() const { return m_startTime; }

    TransactionStatus status() const;
    bool isActive() const { return status() == TransactionStatus::Active; }

    /**
     * Operation log, in the order operations were recorded
     */
    std::vector<std::string> operations() const;

    /**
     * Paths with staged content, in first-staging order
     */
    std::vector<std::filesystem::path> stagedPaths() const;

    /**
     * Staged bytes for a path, if any
     */
    std::optional<QByteArray> stagedContent(const std::filesystem::path& path) const;

    /**
     * True once the path's original state has been captured
     */
    bool hasOriginal(const std::filesystem::path& path) const;

    /**
     * Captured original bytes; nullopt when the path did not exist at first touch
     * or was never touched
     */
    std::optional<QByteArray> originalContent(const std::filesystem::path& path) const;

private:
    friend class FileSafetyManager;

    struct Original {
        bool existed = false;
        QByteArray content;
    };

    struct Staged {
        std::filesystem::path path;
        QByteArray content;
    };

    // Returns true if this call captured the original
    bool captureOriginal(const std::filesystem::path& path, std::optional<QByteArray> content);
    void stage(const std::filesystem::path& path, const QByteArray& content);
    void logOperation(const std::string& operation);
    void setStatus(TransactionStatus status);

    std::map<std::filesystem::path, Original> originalsSnapshot() const;
    std::vector<Staged> stagedSnapshot() const;

    std::string m_id;
    std::string m_description;
    std::string m_actor;
    QDateTime m_startTime;

    mutable QMutex m_mutex;
    TransactionStatus m_status = TransactionStatus::Active;
    std::map<std::filesystem::path, Original> m_originals;
    std::vector<Staged> m_staged;
    std::vector<std::string> m_operations;
};

using TransactionPtr = std::shared_ptr<Transaction>;

} // namespace xmlguard
