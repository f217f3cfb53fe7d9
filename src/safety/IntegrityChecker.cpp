/**
 * XmlGuard - XML Integrity Checker Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "IntegrityChecker.hpp"
#include "xml/XmlDocument.hpp"
#include "xml/XmlEncoding.hpp"

namespace xmlguard {

IntegrityChecker::IntegrityChecker(std::uint64_t maxFileSize)
    : m_maxFileSize(maxFileSize)
{
}

IntegrityCheckResult IntegrityChecker::check(const QByteArray& content) const {
    IntegrityCheckResult result;
    const auto size = static_cast<std::uint64_t>(content.size());

    auto decoded = xml::decodeBytes(content);
    result.details["size"] = std::to_string(size);
    result.details["encoding"] = decoded.encoding.toStdString();

    QString parseError;
    auto doc = xml::XmlDocument::parse(decoded.text, &parseError);
    if (!doc) {
        result.addError("XML parse failed: " + parseError.toStdString());
    } else {
        result.details["rootElement"] = doc->root()->name().toStdString();
    }

    auto declared = xml::declaredEncoding(decoded.text);
    if (!xml::startsWithPrologue(decoded.text) || !declared) {
        result.addError("Missing XML declaration or encoding attribute");
    } else {
        result.details["declaredEncoding"] = declared->toStdString();
    }

    if (size > m_maxFileSize) {
        result.addError("Content size " + std::to_string(size) +
                        " exceeds limit of " + std::to_string(m_maxFileSize) + " bytes");
    }

    if (size == 0) {
        result.addError("Content is empty");
    }

    return result;
}

} // namespace xmlguard
