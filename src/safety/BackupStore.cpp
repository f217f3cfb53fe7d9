/**
 * XmlGuard - Backup Store Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "BackupStore.hpp"
#include "AtomicFile.hpp"
#include "SafetyErrors.hpp"

#include <algorithm>
#include <system_error>
#include <tuple>
#include <utility>

#include <QCryptographicHash>
#include <QDateTime>
#include <QMutexLocker>
#include <QUuid>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace xmlguard {

namespace {

constexpr const char* BACKUP_DIR_SUFFIX = "_backups";
constexpr const char* BACKUP_EXTENSION = ".bak";
constexpr std::size_t STAMP_LENGTH = 15;   // yyyyMMdd_HHmmss

struct ParsedToken {
    std::string stamp;
    int sequence = 0;
    QDateTime timestamp;
};

std::optional<ParsedToken> parseToken(const std::string& token) {
    if (token.size() < STAMP_LENGTH) {
        return std::nullopt;
    }

    ParsedToken parsed;
    parsed.stamp = token.substr(0, STAMP_LENGTH);
    parsed.timestamp = QDateTime::fromString(QString::fromStdString(parsed.stamp),
                                             BackupStore::TIMESTAMP_FORMAT);
    if (!parsed.timestamp.isValid()) {
        return std::nullopt;
    }

    if (token.size() > STAMP_LENGTH) {
        if (token[STAMP_LENGTH] != '-') {
            return std::nullopt;
        }
        try {
            parsed.sequence = std::stoi(token.substr(STAMP_LENGTH + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return parsed;
}

// Timestamp token of a backup file name, e.g. "c.xml.20260101_120000-1.bak"
std::optional<std::string> tokenFromFileName(const std::string& backupName, const std::string& fileName) {
    const std::string prefix = fileName + ".";
    const std::string suffix = BACKUP_EXTENSION;

    if (backupName.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (backupName.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (backupName.compare(backupName.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

    return backupName.substr(prefix.size(), backupName.size() - prefix.size() - suffix.size());
}

} // anonymous namespace

std::string sha256Hex(const QByteArray& content) {
    return QCryptographicHash::hash(content, QCryptographicHash::Sha256).toHex().toStdString();
}

BackupStore::BackupStore(std::filesystem::path backupRoot, int maxVersions)
    : m_root(std::move(backupRoot))
    , m_maxVersions(std::max(1, maxVersions))
{
}

std::filesystem::path BackupStore::directoryFor(const std::filesystem::path& originalPath) const {
    return m_root / (originalPath.filename().string() + BACKUP_DIR_SUFFIX);
}

BackupRecord BackupStore::createBackup(const std::filesystem::path& originalPath,
                                       const QByteArray& content,
                                       const std::string& operation,
                                       std::vector<NonFatalIssue>& warnings) {
    QMutexLocker lock(&m_mutex);

    const auto fileName = originalPath.filename().string();
    const auto directory = directoryFor(originalPath);

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw IOFailure("Create backup directory", directory, ec.message());
    }

    const auto now = QDateTime::currentDateTime();
    const std::string stamp = now.toString(TIMESTAMP_FORMAT).toStdString();

    std::string token = stamp;
    auto backupPath = directory / (fileName + "." + token + BACKUP_EXTENSION);
    for (int sequence = 1; std::filesystem::exists(backupPath); ++sequence) {
        token = stamp + "-" + std::to_string(sequence);
        backupPath = directory / (fileName + "." + token + BACKUP_EXTENSION);
    }

    fileio::writeNew(backupPath, content);

    BackupRecord record;
    record.id = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
    record.timestamp = QDateTime::fromString(QString::fromStdString(stamp), TIMESTAMP_FORMAT);
    record.timestampToken = token;
    record.originalPath = originalPath;
    record.backupPath = backupPath;
    record.checksum = sha256Hex(content);
    record.size = static_cast<std::uint64_t>(content.size());
    record.operation = operation;

    spdlog::info("Backed up {} -> {} (sha256 {})",
                 originalPath.string(), backupPath.string(), record.checksum);

    auto entries = readIndex(directory, &warnings);
    entries.push_back({record.id, backupPath.filename().string(), originalPath.string(),
                       record.checksum, operation});
    writeIndex(directory, entries, warnings);

    prune(directory, originalPath, warnings);
    return record;
}

std::vector<BackupRecord> BackupStore::history(const std::filesystem::path& originalPath) const {
    QMutexLocker lock(&m_mutex);
    return listDirectory(directoryFor(originalPath), originalPath.filename().string(), originalPath);
}

std::optional<BackupRecord> BackupStore::find(const std::filesystem::path& originalPath,
                                              const std::string& timestampToken) const {
    for (auto& record : history(originalPath)) {
        if (record.timestampToken == timestampToken) {
            return record;
        }
    }
    return std::nullopt;
}

std::vector<BackupRecord> BackupStore::allIndexedBackups() const {
    QMutexLocker lock(&m_mutex);
    std::vector<BackupRecord> all;

    std::error_code ec;
    if (!std::filesystem::is_directory(m_root, ec)) {
        return all;
    }

    const std::string suffix = BACKUP_DIR_SUFFIX;
    for (const auto& entry : std::filesystem::directory_iterator(m_root, ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        auto dirName = entry.path().filename().string();
        if (dirName.size() <= suffix.size() ||
            dirName.compare(dirName.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }

        auto fileName = dirName.substr(0, dirName.size() - suffix.size());
        for (auto& record : listDirectory(entry.path(), fileName, std::nullopt)) {
            if (!record.id.empty()) {
                all.push_back(std::move(record));
            }
        }
    }

    if (ec) {
        spdlog::warn("Failed to scan backup root {}: {}", m_root.string(), ec.message());
    }

    // Within one second "-2" sorts before "-10" by length first
    std::sort(all.begin(), all.end(), [](const BackupRecord& a, const BackupRecord& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return std::make_pair(a.timestampToken.size(), a.timestampToken) >
               std::make_pair(b.timestampToken.size(), b.timestampToken);
    });
    return all;
}

std::vector<BackupRecord> BackupStore::listDirectory(
    const std::filesystem::path& directory,
    const std::string& fileName,
    const std::optional<std::filesystem::path>& originalFilter) const
{
    struct Candidate {
        BackupRecord record;
        ParsedToken token;
        std::filesystem::file_time_type modified;
    };

    std::vector<Candidate> candidates;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return {};
    }

    auto index = readIndex(directory, nullptr);

    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }

        auto backupName = entry.path().filename().string();
        auto token = tokenFromFileName(backupName, fileName);
        if (!token) {
            continue;
        }
        auto parsed = parseToken(*token);
        if (!parsed) {
            spdlog::debug("Ignoring backup with unparseable name: {}", backupName);
            continue;
        }

        Candidate candidate;
        candidate.token = *parsed;
        candidate.modified = entry.last_write_time(ec);
        candidate.record.timestamp = parsed->timestamp;
        candidate.record.timestampToken = *token;
        candidate.record.backupPath = entry.path();
        candidate.record.operation = "unknown";

        auto indexed = std::find_if(index.begin(), index.end(),
            [&backupName](const IndexEntry& e) { return e.backupFile == backupName; });
        if (indexed != index.end()) {
            candidate.record.id = indexed->id;
            candidate.record.operation = indexed->operation;
            candidate.record.originalPath = indexed->originalPath;
        } else if (originalFilter) {
            candidate.record.originalPath = *originalFilter;
        }

        // Same file name, different directory: not this file's history
        if (originalFilter && candidate.record.originalPath != *originalFilter) {
            continue;
        }

        try {
            auto content = fileio::readAll(entry.path());
            candidate.record.size = static_cast<std::uint64_t>(content.size());
            candidate.record.checksum = sha256Hex(content);
        } catch (const SafetyError& e) {
            spdlog::warn("Failed to read backup {}: {}", entry.path().string(), e.what());
        }

        candidates.push_back(std::move(candidate));
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return std::tie(a.token.stamp, a.token.sequence, a.modified) >
               std::tie(b.token.stamp, b.token.sequence, b.modified);
    });

    std::vector<BackupRecord> records;
    records.reserve(candidates.size());
    for (auto& candidate : candidates) {
        records.push_back(std::move(candidate.record));
    }
    return records;
}

void BackupStore::prune(const std::filesystem::path& directory,
                        const std::filesystem::path& originalPath,
                        std::vector<NonFatalIssue>& warnings) {
    auto backups = listDirectory(directory, originalPath.filename().string(), originalPath);
    if (static_cast<int>(backups.size()) <= m_maxVersions) {
        return;
    }

    std::vector<std::string> removed;
    for (std::size_t i = static_cast<std::size_t>(m_maxVersions); i < backups.size(); ++i) {
        const auto& path = backups[i].backupPath;
        std::error_code ec;
        if (std::filesystem::remove(path, ec)) {
            spdlog::debug("Removed old backup: {}", path.string());
            removed.push_back(path.filename().string());
        } else {
            spdlog::warn("Failed to remove old backup {}: {}", path.string(), ec.message());
            warnings.push_back({"PRUNE_BACKUPS", path.string(),
                                ec ? ec.message() : "file vanished"});
        }
    }

    if (removed.empty()) {
        return;
    }

    auto entries = readIndex(directory, &warnings);
    entries.erase(std::remove_if(entries.begin(), entries.end(),
        [&removed](const IndexEntry& e) {
            return std::find(removed.begin(), removed.end(), e.backupFile) != removed.end();
        }), entries.end());
    writeIndex(directory, entries, warnings);
}

std::vector<BackupStore::IndexEntry> BackupStore::readIndex(
    const std::filesystem::path& directory,
    std::vector<NonFatalIssue>* warnings) const
{
    std::vector<IndexEntry> entries;
    const auto indexPath = directory / INDEX_FILE;

    std::error_code ec;
    if (!std::filesystem::exists(indexPath, ec)) {
        return entries;
    }

    try {
        auto content = fileio::readAll(indexPath);
        auto j = nlohmann::json::parse(content.toStdString());

        if (j.is_array()) {
            for (const auto& item : j) {
                IndexEntry entry;
                entry.id = item.value("id", "");
                entry.backupFile = item.value("backupFile", "");
                entry.originalPath = item.value("originalPath", "");
                entry.checksum = item.value("checksum", "");
                entry.operation = item.value("operation", "unknown");
                if (!entry.backupFile.empty()) {
                    entries.push_back(std::move(entry));
                }
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to read backup index {}: {}", indexPath.string(), e.what());
        if (warnings) {
            warnings->push_back({"BACKUP_INDEX", indexPath.string(), e.what()});
        }
    }
    return entries;
}

void BackupStore::writeIndex(const std::filesystem::path& directory,
                             const std::vector<IndexEntry>& entries,
                             std::vector<NonFatalIssue>& warnings) {
    const auto indexPath = directory / INDEX_FILE;

    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : entries) {
        j.push_back({
            {"id", entry.id},
            {"backupFile", entry.backupFile},
            {"originalPath", entry.originalPath},
            {"checksum", entry.checksum},
            {"operation", entry.operation}
        });
    }

    try {
        fileio::atomicWrite(indexPath, QByteArray::fromStdString(j.dump(2)));
    } catch (const SafetyError& e) {
        spdlog::warn("Failed to update backup index {}: {}", indexPath.string(), e.what());
        warnings.push_back({"BACKUP_INDEX", indexPath.string(), e.what()});
    }
}

} // namespace xmlguard
