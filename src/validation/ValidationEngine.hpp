/**
 * XmlGuard - Validation Engine
 *
 * Runs the rule registry over a document snapshot on a bounded worker pool.
 * Each rule gets a fixed time budget; a rule that throws or runs out of time
 * contributes nothing and is listed in the report's skipped rules.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <QByteArray>
#include <QMutex>
#include <QThreadPool>

#include "ReferenceIndex.hpp"
#include "ValidationReport.hpp"
#include "ValidationRule.hpp"
#include "core/config/ValidationConfig.hpp"
#include "documents/DocumentStore.hpp"

namespace xmlguard {

class FileSafetyManager;

/**
 * Consistency validation over XML game data
 *
 * The FileSafetyManager must outlive the engine.
 */
class ValidationEngine {
public:
    ValidationEngine(FileSafetyManager& safety, ValidationConfig config);

    ValidationEngine(const ValidationEngine&) = delete;
    ValidationEngine& operator=(const ValidationEngine&) = delete;

    /**
     * Load every document under the given directories and run all rules
     *
     * The loaded snapshot is kept for validateFileChange().
     */
    ValidationReport validateAll(const std::vector<std::filesystem::path>& directories);

    /**
     * Run all rules over an already loaded snapshot (which is kept)
     */
    ValidationReport validateSnapshot(DocumentSnapshot snapshot);

    /**
     * Check an edit of one document against the kept snapshot
     *
     * Only the changed document is parsed. Rules that read that kind of
     * document run over the snapshot with the new version swapped in; the
     * report keeps findings in the changed document, in documents that
     * reference it, and in documents a rule's relatedFiles hook names (NPC
     * files for an experience table, other definers of a shared id). The
     * kept snapshot itself is not updated.
     */
    ValidationReport validateFileChange(const std::filesystem::path& path,
                                        const QByteArray& newContent);

    // Registry
    void addRule(ValidationRule rule);
    bool removeRule(const std::string& name);
    std::vector<ValidationRule> rules() const;

    DocumentSnapshot snapshot() const;
    const ValidationConfig& config() const { return m_config; }

private:
    ValidationReport runRules(const std::vector<ValidationRule>& rules,
                              const DocumentSnapshot& snapshot,
                              const std::shared_ptr<const ReferenceIndex>& index);

    FileSafetyManager& m_safety;
    ValidationConfig m_config;
    DocumentStore m_store;

    mutable QMutex m_mutex;
    std::vector<ValidationRule> m_rules;
    DocumentSnapshot m_snapshot;
    std::shared_ptr<const ReferenceIndex> m_index;

    QThreadPool m_rulePool;
};

} // namespace xmlguard
