/**
 * XmlGuard - Validation Engine Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ValidationEngine.hpp"
#include "concurrency/TimedBatch.hpp"
#include "rules/RuleRegistry.hpp"
#include "safety/FileSafetyManager.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

#include <QElapsedTimer>
#include <QMutexLocker>

#include <spdlog/spdlog.h>

namespace xmlguard {

ValidationEngine::ValidationEngine(FileSafetyManager& safety, ValidationConfig config)
    : m_safety(safety)
    , m_config(std::move(config))
    , m_store(safety, m_config)
    , m_rules(rules::defaultRules(m_config))
{
    m_rulePool.setMaxThreadCount(std::max(1, m_config.ruleThreads));
    spdlog::debug("Validation engine ready with {} rules", m_rules.size());
}

void ValidationEngine::addRule(ValidationRule rule) {
    if (rule.name.empty() || !rule.validate) {
        throw std::invalid_argument("A rule needs a name and a validate function");
    }

    QMutexLocker lock(&m_mutex);
    auto it = std::find_if(m_rules.begin(), m_rules.end(),
        [&rule](const ValidationRule& existing) { return existing.name == rule.name; });

    if (it != m_rules.end()) {
        spdlog::info("Replacing rule {}", rule.name);
        *it = std::move(rule);
    } else {
        m_rules.push_back(std::move(rule));
    }
}

bool ValidationEngine::removeRule(const std::string& name) {
    QMutexLocker lock(&m_mutex);
    auto it = std::find_if(m_rules.begin(), m_rules.end(),
        [&name](const ValidationRule& rule) { return rule.name == name; });

    if (it == m_rules.end()) {
        return false;
    }
    m_rules.erase(it);
    return true;
}

std::vector<ValidationRule> ValidationEngine::rules() const {
    QMutexLocker lock(&m_mutex);
    return m_rules;
}

DocumentSnapshot ValidationEngine::snapshot() const {
    QMutexLocker lock(&m_mutex);
    return m_snapshot;
}

ValidationReport ValidationEngine::validateAll(const std::vector<std::filesystem::path>& directories) {
    QElapsedTimer timer;
    timer.start();

    for (const auto& dir : directories) {
        spdlog::info("Starting data consistency validation for: {}", dir.string());
    }

    auto report = validateSnapshot(m_store.loadAll(directories));
    report.setElapsedMs(timer.elapsed());
    return report;
}

ValidationReport ValidationEngine::validateSnapshot(DocumentSnapshot snapshot) {
    QElapsedTimer timer;
    timer.start();

    if (!snapshot) {
        snapshot = std::make_shared<const DocumentMap>();
    }
    auto index = std::make_shared<const ReferenceIndex>(ReferenceIndex::build(*snapshot));

    std::vector<ValidationRule> registered;
    {
        QMutexLocker lock(&m_mutex);
        m_snapshot = snapshot;
        m_index = index;
        registered = m_rules;
    }

    auto report = runRules(registered, snapshot, index);
    report.setElapsedMs(timer.elapsed());

    spdlog::info("Validation completed in {} ms: {}", report.elapsedMs(), report.summary());
    return report;
}

ValidationReport ValidationEngine::validateFileChange(const std::filesystem::path& path,
                                                      const QByteArray& newContent) {
    QElapsedTimer timer;
    timer.start();

    const auto canonical = m_safety.canonicalPath(path);

    DocumentSnapshot base;
    std::shared_ptr<const ReferenceIndex> baseIndex;
    std::vector<ValidationRule> registered;
    {
        QMutexLocker lock(&m_mutex);
        base = m_snapshot;
        baseIndex = m_index;
        registered = m_rules;
    }

    if (!base) {
        spdlog::warn("No documents loaded yet, checking {} on its own", canonical.string());
        base = std::make_shared<const DocumentMap>();
    }

    // Key of the loaded version of this file, or its bare name if it is new
    std::string key = canonical.filename().generic_string();
    for (const auto& [existingKey, doc] : *base) {
        if (doc && doc->sourcePath() == canonical) {
            key = existingKey;
            break;
        }
    }

    ValidationReport report;

    QString parseError;
    auto doc = DocumentStore::parseDocument(newContent, canonical, &parseError);
    if (!doc) {
        ValidationResult result;
        result.severity = Severity::Error;
        result.type = result_type::MALFORMED_DOCUMENT;
        result.message = "Document cannot be parsed: " + parseError.toStdString();
        result.file = key;
        result.suggestions = {"Fix the XML syntax before saving"};
        report.addResult(std::move(result));
        report.setElapsedMs(timer.elapsed());
        return report;
    }

    auto overlay = std::make_shared<DocumentMap>(*base);
    (*overlay)[key] = doc;
    DocumentSnapshot changed = overlay;
    auto index = std::make_shared<const ReferenceIndex>(ReferenceIndex::build(*changed));

    std::set<std::string> related = index->filesReferencing(key);
    if (baseIndex) {
        auto previous = baseIndex->filesReferencing(key);
        related.insert(previous.begin(), previous.end());
    }

    std::vector<ValidationRule> relevant;
    std::copy_if(registered.begin(), registered.end(), std::back_inserter(relevant),
                 [&key](const ValidationRule& rule) { return rule.isRelevantTo(key); });

    for (const auto& rule : relevant) {
        if (!rule.relatedFiles) {
            continue;
        }
        auto after = rule.relatedFiles(key, *changed, *index);
        related.insert(after.begin(), after.end());
        if (baseIndex) {
            auto before = rule.relatedFiles(key, *base, *baseIndex);
            related.insert(before.begin(), before.end());
        }
    }
    related.insert(key);

    spdlog::debug("Checking change of {} with {} rules across {} documents",
                  key, relevant.size(), related.size());

    report = runRules(relevant, changed, index);
    report.retainIf([&related](const ValidationResult& result) {
        return related.count(result.file) > 0;
    });
    report.setElapsedMs(timer.elapsed());

    spdlog::info("Change check of {}: {}", key, report.summary());
    return report;
}

ValidationReport ValidationEngine::runRules(const std::vector<ValidationRule>& rules,
                                            const DocumentSnapshot& snapshot,
                                            const std::shared_ptr<const ReferenceIndex>& index) {
    ValidationReport report;
    TimedBatch<std::vector<ValidationResult>> batch(&m_rulePool);

    for (const auto& rule : rules) {
        // Jobs own the snapshot and index so a timed-out rule stays safe
        batch.submit(rule.name, [name = rule.name, validate = rule.validate, snapshot, index]() {
            spdlog::debug("Executing rule: {}", name);
            auto results = validate(*snapshot, *index);
            for (auto& result : results) {
                result.rule = name;
            }
            return results;
        });
    }

    for (auto& outcome : batch.collect(m_config.ruleTimeoutMs)) {
        if (outcome.timedOut) {
            spdlog::warn("Rule {} timed out after {} ms", outcome.name, m_config.ruleTimeoutMs);
            report.addSkippedRule({outcome.name,
                                   "timed out after " + std::to_string(m_config.ruleTimeoutMs) + " ms"});
        } else if (!outcome.succeeded()) {
            spdlog::error("Rule execution failed: {}: {}", outcome.name, outcome.error);
            report.addSkippedRule({outcome.name, outcome.error});
        } else {
            report.addResults(std::move(*outcome.value));
        }
    }

    return report;
}

} // namespace xmlguard
