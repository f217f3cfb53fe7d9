/**
 * XmlGuard - XML Text Decoding
 *
 * Game data files are a mix of UTF-16 (usually with BOM) and UTF-8. These
 * helpers turn raw bytes into text the way every loader in the project
 * expects: UTF-16 first, UTF-8 when the result is not an XML prologue.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>

#include <QByteArray>
#include <QString>

namespace xmlguard::xml {

/**
 * Decoded document text and the encoding that produced it
 */
struct DecodedText {
    QString text;
    QString encoding;   // "UTF-16LE", "UTF-16BE" or "UTF-8"
};

/**
 * Decode raw file bytes
 *
 * Attempts UTF-16 when a BOM or a zero byte next to the first non-blank
 * character suggests it, and keeps the result only if it starts with an
 * XML declaration. Otherwise decodes as UTF-8 (BOM stripped). Whitespace
 * ahead of the declaration is removed from the returned text.
 */
DecodedText decodeBytes(const QByteArray& bytes);

/**
 * Check whether decoded text starts with "<?xml" (leading whitespace allowed)
 */
bool startsWithPrologue(const QString& text);

/**
 * Extract the encoding attribute of the XML declaration, if any
 */
std::optional<QString> declaredEncoding(const QString& text);

} // namespace xmlguard::xml
