/**
 * XmlGuard - Transaction Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Transaction.hpp"

#include <algorithm>

#include <QMutexLocker>
#include <QUuid>

namespace xmlguard {

std::string transactionStatusToString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::Active:     return "Active";
        case TransactionStatus::Committed:  return "Committed";
        case TransactionStatus::RolledBack: return "RolledBack";
        case TransactionStatus::Failed:     return "Failed";
    }
    return "Unknown";
}

Transaction::Transaction(std::string description, std::string actor)
    : m_id(QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString())
    , m_description(std::move(description))
    , m_actor(std::move(actor))
    , m_startTime(QDateTime::currentDateTime())
{
}

TransactionStatus Transaction::status() const {
    QMutexLocker lock(&m_mutex);
    return m_status;
}

std::vector<std::string> Transaction::operations() const {
    QMutexLocker lock(&m_mutex);
    return m_operations;
}

std::vector<std::filesystem::path> Transaction::stagedPaths() const {
    QMutexLocker lock(&m_mutex);
    std::vector<std::filesystem::path> paths;
    paths.reserve(m_staged.size());
    for (const auto& staged : m_staged) {
        paths.push_back(staged.path);
    }
    return paths;
}

std::optional<QByteArray> Transaction::stagedContent(const std::filesystem::path& path) const {
    QMutexLocker lock(&m_mutex);
    for (const auto& staged : m_staged) {
        if (staged.path == path) {
            return staged.content;
        }
    }
    return std::nullopt;
}

bool Transaction::hasOriginal(const std::filesystem::path& path) const {
    QMutexLocker lock(&m_mutex);
    return m_originals.count(path) > 0;
}

std::optional<QByteArray> Transaction::originalContent(const std::filesystem::path& path) const {
    QMutexLocker lock(&m_mutex);
    auto it = m_originals.find(path);
    if (it == m_originals.end() || !it->second.existed) {
        return std::nullopt;
    }
    return it->second.content;
}

bool Transaction::captureOriginal(const std::filesystem::path& path, std::optional<QByteArray> content) {
    QMutexLocker lock(&m_mutex);
    if (m_originals.count(path) > 0) {
        return false;
    }

    Original original;
    original.existed = content.has_value();
    if (content) {
        original.content = std::move(*content);
    }
    m_originals.emplace(path, std::move(original));
    return true;
}

void Transaction::stage(const std::filesystem::path& path, const QByteArray& content) {
    QMutexLocker lock(&m_mutex);
    auto it = std::find_if(m_staged.begin(), m_staged.end(),
        [&path](const Staged& staged) { return staged.path == path; });

    // Re-staging a path keeps its original position in the write order
    if (it != m_staged.end()) {
        it->content = content;
    } else {
        m_staged.push_back({path, content});
    }
    m_operations.push_back("WRITE: " + path.string());
}

void Transaction::logOperation(const std::string& operation) {
    QMutexLocker lock(&m_mutex);
    m_operations.push_back(operation);
}

void Transaction::setStatus(TransactionStatus status) {
    QMutexLocker lock(&m_mutex);
    m_status = status;
}

std::map<std::filesystem::path, Transaction::Original> Transaction::originalsSnapshot() const {
    QMutexLocker lock(&m_mutex);
    return m_originals;
}

std::vector<Transaction::Staged> Transaction::stagedSnapshot() const {
    QMutexLocker lock(&m_mutex);
    return m_staged;
}

} // namespace xmlguard
