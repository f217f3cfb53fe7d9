/**
 * XmlGuard - XML Integrity Checker
 *
 * Structural checks applied to every byte sequence before it reaches disk.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>

#include <QByteArray>

#include "SafetyRecords.hpp"

namespace xmlguard {

/**
 * Validates raw XML content
 *
 * Checks, all of which always run:
 * - the content parses and has a root element
 * - an XML declaration with an encoding attribute is present
 * - the content is not empty
 * - the content is not larger than the configured limit
 */
class IntegrityChecker {
public:
    static constexpr std::uint64_t DEFAULT_MAX_FILE_SIZE = 100ull * 1024 * 1024;

    explicit IntegrityChecker(std::uint64_t maxFileSize = DEFAULT_MAX_FILE_SIZE);

    IntegrityCheckResult check(const QByteArray& content) const;

    std::uint64_t maxFileSize() const { return m_maxFileSize; }

private:
    std::uint64_t m_maxFileSize;
};

} // namespace xmlguard
