/**
 * XmlGuard - Document Store Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "DocumentStore.hpp"
#include "concurrency/TimedBatch.hpp"
#include "safety/FileSafetyManager.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <system_error>

#include <QElapsedTimer>

#include <spdlog/spdlog.h>

namespace xmlguard {

namespace {

bool hasXmlExtension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".xml";
}

} // anonymous namespace

DocumentStore::DocumentStore(FileSafetyManager& safety, const ValidationConfig& config)
    : m_safety(safety)
    , m_timeoutMs(config.fileLoadTimeoutMs)
{
    m_pool.setMaxThreadCount(std::max(1, config.loaderThreads));
}

std::vector<std::filesystem::path> DocumentStore::discoverXmlFiles(const std::filesystem::path& root) {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", root.string(), ec.message());
        return files;
    }

    for (const std::filesystem::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error while scanning {}: {}", root.string(), ec.message());
            break;
        }
        if (it->is_regular_file(ec) && hasXmlExtension(it->path())) {
            files.push_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string DocumentStore::keyFor(const std::filesystem::path& root, const std::filesystem::path& file) {
    auto relative = file.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        return file.filename().generic_string();
    }
    return relative.generic_string();
}

DocumentPtr DocumentStore::parseDocument(const QByteArray& bytes,
                                         const std::filesystem::path& sourcePath,
                                         QString* errorMessage) {
    auto doc = xml::XmlDocument::parseBytes(bytes, errorMessage);
    if (!doc) {
        return nullptr;
    }
    doc->setSourcePath(sourcePath);
    return doc;
}

DocumentSnapshot DocumentStore::loadAll(const std::vector<std::filesystem::path>& rootDirs) {
    QElapsedTimer timer;
    timer.start();

    m_lastStats = LoadStats{};
    std::set<std::string> seenKeys;

    TimedBatch<DocumentPtr> batch(&m_pool);
    FileSafetyManager& safety = m_safety;

    for (const auto& root : rootDirs) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            spdlog::warn("Data directory does not exist: {}", root.string());
            ++m_lastStats.missingRoots;
            continue;
        }

        for (const auto& file : discoverXmlFiles(root)) {
            ++m_lastStats.discovered;

            auto key = keyFor(root, file);
            if (!seenKeys.insert(key).second) {
                spdlog::warn("Duplicate document key {} ({}), keeping the first one",
                             key, file.string());
                ++m_lastStats.duplicateKeys;
                continue;
            }

            batch.submit(key, [&safety, file]() -> DocumentPtr {
                auto bytes = safety.safeRead(file);

                QString error;
                auto doc = parseDocument(bytes, safety.canonicalPath(file), &error);
                if (!doc) {
                    throw std::runtime_error(error.toStdString());
                }
                return doc;
            });
        }
    }

    auto documents = std::make_shared<DocumentMap>();
    for (auto& outcome : batch.collect(m_timeoutMs)) {
        if (outcome.timedOut) {
            spdlog::warn("Timed out after {} ms loading {}", m_timeoutMs, outcome.name);
            ++m_lastStats.timedOut;
        } else if (!outcome.succeeded()) {
            spdlog::warn("Failed to load {}: {}", outcome.name, outcome.error);
            ++m_lastStats.failed;
        } else {
            documents->emplace(outcome.name, std::move(*outcome.value));
            ++m_lastStats.loaded;
        }
    }

    spdlog::info("Loaded {} of {} XML files in {} ms ({} failed, {} timed out)",
                 m_lastStats.loaded, m_lastStats.discovered, timer.elapsed(),
                 m_lastStats.failed, m_lastStats.timedOut);

    return documents;
}

} // namespace xmlguard
