/**
 * XmlGuard - XML Document
 *
 * Read-only element tree built with QXmlStreamReader. Documents are parsed
 * once and shared between validation rules, so nothing here mutates after
 * parse() returns.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QHash>
#include <QString>

namespace xmlguard::xml {

/**
 * A single element of a parsed document
 */
class XmlElement {
public:
    const QString& name() const { return m_name; }

    /**
     * Attribute value, or defaultValue if the attribute is missing
     */
    QString attribute(const QString& name, const QString& defaultValue = QString()) const;
    bool hasAttribute(const QString& name) const;
    const std::vector<std::pair<QString, QString>>& attributes() const { return m_attributes; }

    /**
     * Character data directly inside this element, trimmed
     */
    const QString& text() const { return m_text; }

    const std::vector<std::unique_ptr<XmlElement>>& children() const { return m_children; }
    const XmlElement* parent() const { return m_parent; }

    /**
     * Location of the element, e.g. /items/item[3]
     *
     * Non-root steps carry the 1-based position among same-named siblings.
     */
    const QString& path() const { return m_path; }

    qint64 lineNumber() const { return m_line; }

private:
    friend class XmlDocument;

    QString m_name;
    QString m_text;
    QString m_path;
    qint64 m_line = 0;
    std::vector<std::pair<QString, QString>> m_attributes;
    std::vector<std::unique_ptr<XmlElement>> m_children;
    const XmlElement* m_parent = nullptr;
};

/**
 * Parsed XML document
 */
class XmlDocument {
public:
    /**
     * Parse decoded XML text
     *
     * @param text Document text
     * @param errorMessage Receives the reader error (with line/column) on failure
     * @return The document, or nullptr on malformed input or a missing root
     */
    static std::shared_ptr<XmlDocument> parse(const QString& text, QString* errorMessage = nullptr);

    /**
     * Decode raw bytes (UTF-16 first, UTF-8 fallback) and parse them
     */
    static std::shared_ptr<XmlDocument> parseBytes(const QByteArray& bytes, QString* errorMessage = nullptr);

    const XmlElement* root() const { return m_root.get(); }

    /**
     * All elements with the given tag name, in document order
     */
    const std::vector<const XmlElement*>& elementsByTagName(const QString& name) const;

    std::size_t elementCount() const { return m_elementCount; }

    bool hasDeclaration() const { return m_hasDeclaration; }
    const QString& declaredEncoding() const { return m_declaredEncoding; }

    /**
     * Encoding used to decode the bytes (empty when parsed from text)
     */
    const QString& sourceEncoding() const { return m_sourceEncoding; }

    const std::filesystem::path& sourcePath() const { return m_sourcePath; }
    void setSourcePath(const std::filesystem::path& path) { m_sourcePath = path; }

    /**
     * Maximum element nesting accepted by the parser
     */
    static constexpr int MAX_DEPTH = 512;

private:
    XmlDocument() = default;

    std::unique_ptr<XmlElement> m_root;
    QHash<QString, std::vector<const XmlElement*>> m_byTag;
    std::size_t m_elementCount = 0;
    bool m_hasDeclaration = false;
    QString m_declaredEncoding;
    QString m_sourceEncoding;
    std::filesystem::path m_sourcePath;
};

} // namespace xmlguard::xml
