/**
 * XmlGuard - Report Formatter
 *
 * Pure rendering of a ValidationReport; no validation logic lives here.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <QString>

#include "ValidationReport.hpp"

namespace xmlguard {

class ReportFormatter {
public:
    /**
     * HTML document: summary block, one table per result type with
     * severity-colored rows, then the skipped rules
     */
    static QString toHtml(const ValidationReport& report);

    /**
     * Write toHtml() to a file; false with the reason in errorMessage when
     * the file cannot be opened or not every byte is written
     */
    static bool writeHtml(const ValidationReport& report, const QString& path,
                          QString* errorMessage = nullptr);

    /**
     * One-line text summary
     */
    static QString summary(const ValidationReport& report);
};

} // namespace xmlguard
