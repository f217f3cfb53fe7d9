/**
 * XmlGuard - Validation Result
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace xmlguard {

/**
 * How urgent a finding is
 */
enum class Severity {
    Error,      // Must be fixed
    Warning,    // Should be fixed
    Info        // Optional cleanup
};

std::string severityToString(Severity severity);

/**
 * Result types produced by the built-in rules
 */
namespace result_type {
    constexpr const char* DANGLING_REFERENCE = "dangling reference";
    constexpr const char* EXPERIENCE_MISMATCH = "experience mismatch";
    constexpr const char* ORPHANED_DATA = "orphaned data";
    constexpr const char* BALANCE = "balance";
    constexpr const char* DUPLICATE_IDENTIFIER = "duplicate identifier";
    constexpr const char* MALFORMED_DOCUMENT = "malformed document";
}

/**
 * A single finding of a validation rule
 */
struct ValidationResult {
    Severity severity = Severity::Info;
    std::string type;
    std::string message;
    std::string file;                              // Document key
    std::string elementPath;                       // e.g. /drops/drop[2]
    std::map<std::string, std::string> details;
    std::vector<std::string> suggestions;
    std::string rule;                              // Set by the engine
};

} // namespace xmlguard
