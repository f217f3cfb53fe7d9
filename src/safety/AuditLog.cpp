/**
 * XmlGuard - Audit Log Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "AuditLog.hpp"

#include <system_error>

#include <QFile>
#include <QMutexLocker>

#include <spdlog/spdlog.h>

namespace xmlguard {

AuditLog::AuditLog(std::filesystem::path logPath)
    : m_path(std::move(logPath))
{
}

std::optional<NonFatalIssue> AuditLog::append(const AuditRecord& record) {
    QMutexLocker lock(&m_mutex);

    auto fail = [&](const std::string& reason) -> std::optional<NonFatalIssue> {
        spdlog::error("Failed to write audit record {}: {}", record.operation, reason);
        return NonFatalIssue{"AUDIT", m_path.string(), reason};
    };

    if (m_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec) {
            return fail(ec.message());
        }
    }

    QFile file(QString::fromStdString(m_path.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return fail(file.errorString().toStdString());
    }

    QByteArray line = QByteArray::fromStdString(record.toLine());
    line.append('\n');
    if (file.write(line) != line.size() || !file.flush()) {
        return fail(file.errorString().toStdString());
    }

    return std::nullopt;
}

} // namespace xmlguard
