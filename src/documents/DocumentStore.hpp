/**
 * XmlGuard - Document Store
 *
 * Discovers and parses trees of XML game data into an immutable snapshot
 * shared by every validation rule.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <QByteArray>
#include <QString>
#include <QThreadPool>

#include "core/config/ValidationConfig.hpp"
#include "xml/XmlDocument.hpp"

namespace xmlguard {

class FileSafetyManager;

using DocumentPtr = std::shared_ptr<const xml::XmlDocument>;

/**
 * Documents keyed by their path relative to the root they were found under,
 * with '/' separators (e.g. "items/weapons.xml")
 */
using DocumentMap = std::map<std::string, DocumentPtr>;
using DocumentSnapshot = std::shared_ptr<const DocumentMap>;

/**
 * Counters of the most recent loadAll()
 */
struct LoadStats {
    std::size_t discovered = 0;
    std::size_t loaded = 0;
    std::size_t failed = 0;
    std::size_t timedOut = 0;
    std::size_t duplicateKeys = 0;
    std::size_t missingRoots = 0;
};

/**
 * Loads XML trees through the File Safety Manager
 *
 * Files are read with safeRead() so loading shares the per-path locks of
 * concurrent writers. The manager must outlive the store.
 */
class DocumentStore {
public:
    DocumentStore(FileSafetyManager& safety, const ValidationConfig& config);

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    /**
     * Load every *.xml file under the given roots
     *
     * A file that cannot be read, decoded or parsed (or takes longer than
     * the load timeout) is logged and left out. When two roots produce the
     * same key the first root wins.
     */
    DocumentSnapshot loadAll(const std::vector<std::filesystem::path>& rootDirs);

    /**
     * Parse a single document from raw bytes
     *
     * @return The document, or nullptr (with errorMessage set) on failure
     */
    static DocumentPtr parseDocument(const QByteArray& bytes,
                                     const std::filesystem::path& sourcePath,
                                     QString* errorMessage = nullptr);

    /**
     * *.xml files (any letter case) under a directory, sorted
     */
    static std::vector<std::filesystem::path> discoverXmlFiles(const std::filesystem::path& root);

    /**
     * Snapshot key of a file found under root
     */
    static std::string keyFor(const std::filesystem::path& root, const std::filesystem::path& file);

    const LoadStats& lastLoadStats() const { return m_lastStats; }

private:
    FileSafetyManager& m_safety;
    int m_timeoutMs;
    LoadStats m_lastStats;
    QThreadPool m_pool;
};

} // namespace xmlguard
