/**
 * XmlGuard - Safety Records Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SafetyRecords.hpp"

#include <iterator>

namespace xmlguard {

namespace {

// Keeps one record on one line
std::string singleLine(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '\n') {
            escaped += "\\n";
        } else if (c == '\r') {
            escaped += "\\r";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

} // anonymous namespace

std::string AuditRecord::toLine() const {
    std::string line = "[" + timestamp.toString("yyyy-MM-dd HH:mm:ss").toStdString() + "] "
        + singleLine(operation)
        + " | User: " + singleLine(actor)
        + " | File: " + singleLine(filePath.value_or("-"))
        + " | Success: " + (success ? "true" : "false")
        + " | TxnId: " + singleLine(transactionId.value_or("-"));

    for (const auto& [key, value] : metadata) {
        line += " | " + singleLine(key) + ": " + singleLine(value);
    }

    if (errorMessage) {
        line += " | Error: " + singleLine(*errorMessage);
    }
    return line;
}

std::string IntegrityCheckResult::summary() const {
    std::string joined;
    for (const auto& error : errors) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error;
    }
    return joined;
}

void OperationOutcome::merge(OperationOutcome&& other) {
    warnings.insert(warnings.end(),
                    std::make_move_iterator(other.warnings.begin()),
                    std::make_move_iterator(other.warnings.end()));
    backups.insert(backups.end(),
                   std::make_move_iterator(other.backups.begin()),
                   std::make_move_iterator(other.backups.end()));
    affectedPaths.insert(affectedPaths.end(),
                         std::make_move_iterator(other.affectedPaths.begin()),
                         std::make_move_iterator(other.affectedPaths.end()));
}

} // namespace xmlguard
