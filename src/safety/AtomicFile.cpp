/**
 * XmlGuard - Atomic File I/O Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "AtomicFile.hpp"
#include "SafetyErrors.hpp"

#include <cerrno>
#include <system_error>

#include <QFile>

#include <spdlog/spdlog.h>

#ifdef PLATFORM_LINUX
#include <unistd.h>
#endif

namespace xmlguard::fileio {

namespace {

QString toQString(const std::filesystem::path& path) {
    return QString::fromStdString(path.string());
}

void removeQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove temp file {}: {}", path.string(), ec.message());
    }
}

void writeAndSync(QFile& file, const std::filesystem::path& path, const QByteArray& content) {
    if (file.write(content) != content.size()) {
        throw IOFailure("Write", path, file.errorString().toStdString());
    }
    if (!file.flush()) {
        throw IOFailure("Flush", path, file.errorString().toStdString());
    }
#ifdef PLATFORM_LINUX
    if (::fsync(file.handle()) != 0) {
        throw IOFailure("Sync", path, std::error_code(errno, std::generic_category()).message());
    }
#endif
}

} // anonymous namespace

std::filesystem::path tempPathFor(const std::filesystem::path& path) {
    auto temp = path;
    temp += ".tmp";
    return temp;
}

QByteArray readAll(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw NotFoundError(path);
    }

    QFile file(toQString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        throw IOFailure("Read", path, file.errorString().toStdString());
    }

    QByteArray content = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        throw IOFailure("Read", path, file.errorString().toStdString());
    }
    return content;
}

void atomicWrite(const std::filesystem::path& path, const QByteArray& content) {
    const auto tempPath = tempPathFor(path);

    try {
        {
            QFile temp(toQString(tempPath));
            if (!temp.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
                throw IOFailure("Create temp file", tempPath, temp.errorString().toStdString());
            }
            writeAndSync(temp, tempPath, content);
        }

        // Read back to catch truncated or partial writes before the rename
        QByteArray written = readAll(tempPath);
        if (written != content) {
            throw IOFailure("Verify", tempPath, "content read back does not match");
        }

        std::error_code ec;
        std::filesystem::rename(tempPath, path, ec);
        if (ec) {
            throw IOFailure("Rename", path, ec.message());
        }

        spdlog::debug("Atomic write complete: {} ({} bytes)", path.string(), content.size());
    } catch (const SafetyError&) {
        removeQuietly(tempPath);
        throw;
    }
}

void writeNew(const std::filesystem::path& path, const QByteArray& content) {
    QFile file(toQString(path));
    if (!file.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
        throw IOFailure("Create", path, file.errorString().toStdString());
    }

    try {
        writeAndSync(file, path, content);
    } catch (const SafetyError&) {
        file.close();
        removeQuietly(path);
        throw;
    }
}

} // namespace xmlguard::fileio
