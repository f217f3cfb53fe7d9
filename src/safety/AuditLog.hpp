/**
 * XmlGuard - Audit Log
 *
 * Append-only, line-oriented record of every safety operation.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>

#include <QMutex>

#include "SafetyRecords.hpp"

namespace xmlguard {

/**
 * Audit trail writer
 *
 * Writing is diagnostic, not authoritative: a failed append is logged and
 * reported back as a NonFatalIssue, never thrown.
 */
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path logPath);

    /**
     * Append one record as a line
     *
     * @return The failure, if the line could not be written
     */
    std::optional<NonFatalIssue> append(const AuditRecord& record);

    const std::filesystem::path& path() const { return m_path; }

private:
    QMutex m_mutex;
    std::filesystem::path m_path;
};

} // namespace xmlguard
