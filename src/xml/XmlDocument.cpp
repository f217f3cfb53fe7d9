/**
 * XmlGuard - XML Document Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "XmlDocument.hpp"
#include "XmlEncoding.hpp"

#include <QXmlStreamReader>

namespace xmlguard::xml {

namespace {

// Per open element: how many children of each name were seen so far
struct OpenElement {
    XmlElement* element;
    QHash<QString, int> childCounts;
};

} // anonymous namespace

QString XmlElement::attribute(const QString& name, const QString& defaultValue) const {
    for (const auto& [key, value] : m_attributes) {
        if (key == name) {
            return value;
        }
    }
    return defaultValue;
}

bool XmlElement::hasAttribute(const QString& name) const {
    for (const auto& attr : m_attributes) {
        if (attr.first == name) {
            return true;
        }
    }
    return false;
}

const std::vector<const XmlElement*>& XmlDocument::elementsByTagName(const QString& name) const {
    static const std::vector<const XmlElement*> empty;

    auto it = m_byTag.constFind(name);
    if (it == m_byTag.constEnd()) {
        return empty;
    }
    return it.value();
}

std::shared_ptr<XmlDocument> XmlDocument::parse(const QString& text, QString* errorMessage) {
    std::shared_ptr<XmlDocument> doc(new XmlDocument());
    std::vector<OpenElement> stack;

    QXmlStreamReader reader(text);

    while (!reader.atEnd()) {
        reader.readNext();

        if (reader.isStartDocument()) {
            doc->m_hasDeclaration = !reader.documentVersion().isEmpty();
            doc->m_declaredEncoding = reader.documentEncoding().toString();
        } else if (reader.isStartElement()) {
            if (static_cast<int>(stack.size()) >= MAX_DEPTH) {
                reader.raiseError(QString("Element nesting exceeds %1 levels").arg(MAX_DEPTH));
                break;
            }

            auto element = std::make_unique<XmlElement>();
            element->m_name = reader.qualifiedName().toString();
            element->m_line = reader.lineNumber();

            const auto attributes = reader.attributes();
            element->m_attributes.reserve(attributes.size());
            for (const auto& attr : attributes) {
                element->m_attributes.emplace_back(attr.qualifiedName().toString(),
                                                   attr.value().toString());
            }

            XmlElement* raw = element.get();
            if (stack.empty()) {
                raw->m_path = "/" + raw->m_name;
                doc->m_root = std::move(element);
            } else {
                auto& parent = stack.back();
                int position = ++parent.childCounts[raw->m_name];
                raw->m_parent = parent.element;
                raw->m_path = QString("%1/%2[%3]")
                    .arg(parent.element->m_path, raw->m_name)
                    .arg(position);
                parent.element->m_children.push_back(std::move(element));
            }

            doc->m_byTag[raw->m_name].push_back(raw);
            ++doc->m_elementCount;
            stack.push_back({raw, {}});
        } else if (reader.isEndElement()) {
            if (!stack.empty()) {
                auto* closed = stack.back().element;
                closed->m_text = closed->m_text.trimmed();
                stack.pop_back();
            }
        } else if (reader.isCharacters() && !reader.isWhitespace()) {
            if (!stack.empty()) {
                stack.back().element->m_text += reader.text();
            }
        }
    }

    if (reader.hasError()) {
        if (errorMessage) {
            *errorMessage = QString("%1 (line %2, column %3)")
                .arg(reader.errorString())
                .arg(reader.lineNumber())
                .arg(reader.columnNumber());
        }
        return nullptr;
    }

    if (!doc->m_root) {
        if (errorMessage) {
            *errorMessage = "Document has no root element";
        }
        return nullptr;
    }

    return doc;
}

std::shared_ptr<XmlDocument> XmlDocument::parseBytes(const QByteArray& bytes, QString* errorMessage) {
    auto decoded = decodeBytes(bytes);
    auto doc = parse(decoded.text, errorMessage);
    if (doc) {
        doc->m_sourceEncoding = decoded.encoding;
    }
    return doc;
}

} // namespace xmlguard::xml
