/**
 * XmlGuard - Validation Report
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <QDateTime>

#include "ValidationResult.hpp"

namespace xmlguard {

/**
 * A rule that contributed nothing because it failed or timed out
 */
struct SkippedRule {
    std::string name;
    std::string reason;
};

/**
 * Findings of one validation run, with counts and groupings
 */
class ValidationReport {
public:
    void addResult(ValidationResult result);
    void addResults(std::vector<ValidationResult> results);
    void addSkippedRule(SkippedRule skipped);

    /**
     * Keep only the results matching the predicate (counts and groups follow)
     */
    void retainIf(const std::function<bool(const ValidationResult&)>& keep);

    int errorCount() const { return m_errors; }
    int warningCount() const { return m_warnings; }
    int infoCount() const { return m_infos; }
    bool hasErrors() const { return m_errors > 0; }

    const std::vector<ValidationResult>& results() const { return m_results; }
    const std::vector<SkippedRule>& skippedRules() const { return m_skipped; }

    /**
     * Results grouped by type / by document key, each in insertion order
     */
    std::map<std::string, std::vector<ValidationResult>> resultsByType() const;
    std::map<std::string, std::vector<ValidationResult>> resultsByFile() const;

    std::int64_t elapsedMs() const { return m_elapsedMs; }
    void setElapsedMs(std::int64_t ms) { m_elapsedMs = ms; }

    const QDateTime& timestamp() const { return m_timestamp; }

    /**
     * e.g. "Validation finished: 1 errors, 0 warnings, 2 info"
     */
    std::string summary() const;

private:
    std::vector<ValidationResult> m_results;
    std::vector<SkippedRule> m_skipped;
    int m_errors = 0;
    int m_warnings = 0;
    int m_infos = 0;
    std::int64_t m_elapsedMs = 0;
    QDateTime m_timestamp = QDateTime::currentDateTime();
};

} // namespace xmlguard
