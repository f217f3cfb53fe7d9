/**
 * XmlGuard - Validation Report Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ValidationReport.hpp"

namespace xmlguard {

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::Error:   return "ERROR";
        case Severity::Warning: return "WARNING";
        case Severity::Info:    return "INFO";
    }
    return "UNKNOWN";
}

void ValidationReport::addResult(ValidationResult result) {
    switch (result.severity) {
        case Severity::Error:   ++m_errors; break;
        case Severity::Warning: ++m_warnings; break;
        case Severity::Info:    ++m_infos; break;
    }
    m_results.push_back(std::move(result));
}

void ValidationReport::addResults(std::vector<ValidationResult> results) {
    m_results.reserve(m_results.size() + results.size());
    for (auto& result : results) {
        addResult(std::move(result));
    }
}

void ValidationReport::addSkippedRule(SkippedRule skipped) {
    m_skipped.push_back(std::move(skipped));
}

void ValidationReport::retainIf(const std::function<bool(const ValidationResult&)>& keep) {
    auto results = std::move(m_results);
    m_results.clear();
    m_errors = m_warnings = m_infos = 0;

    for (auto& result : results) {
        if (keep(result)) {
            addResult(std::move(result));
        }
    }
}

std::map<std::string, std::vector<ValidationResult>> ValidationReport::resultsByType() const {
    std::map<std::string, std::vector<ValidationResult>> grouped;
    for (const auto& result : m_results) {
        grouped[result.type].push_back(result);
    }
    return grouped;
}

std::map<std::string, std::vector<ValidationResult>> ValidationReport::resultsByFile() const {
    std::map<std::string, std::vector<ValidationResult>> grouped;
    for (const auto& result : m_results) {
        if (!result.file.empty()) {
            grouped[result.file].push_back(result);
        }
    }
    return grouped;
}

std::string ValidationReport::summary() const {
    std::string text = "Validation finished: " + std::to_string(m_errors) + " errors, " +
                       std::to_string(m_warnings) + " warnings, " +
                       std::to_string(m_infos) + " info";
    if (!m_skipped.empty()) {
        text += " (" + std::to_string(m_skipped.size()) + " rules skipped)";
    }
    return text;
}

} // namespace xmlguard
