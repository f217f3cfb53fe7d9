/**
 * XmlGuard - XML Text Decoding Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "XmlEncoding.hpp"

#include <QRegularExpression>
#include <QStringDecoder>

namespace xmlguard::xml {

namespace {

enum class Utf16Guess {
    None,
    LittleEndian,
    BigEndian
};

Utf16Guess guessUtf16(const QByteArray& bytes) {
    if (bytes.size() < 2) {
        return Utf16Guess::None;
    }

    const auto b0 = static_cast<unsigned char>(bytes[0]);
    const auto b1 = static_cast<unsigned char>(bytes[1]);

    if (b0 == 0xFF && b1 == 0xFE) return Utf16Guess::LittleEndian;
    if (b0 == 0xFE && b1 == 0xFF) return Utf16Guess::BigEndian;

    // No BOM: the first significant byte sits next to a zero byte, even
    // after leading whitespace
    qsizetype first = 0;
    while (first < bytes.size()) {
        const auto c = static_cast<unsigned char>(bytes[first]);
        if (c != 0x00 && c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            break;
        }
        ++first;
    }
    if (first >= bytes.size()) {
        return Utf16Guess::None;
    }

    if (first % 2 == 0 && first + 1 < bytes.size() && bytes[first + 1] == 0x00) {
        return Utf16Guess::LittleEndian;
    }
    if (first % 2 == 1 && bytes[first - 1] == 0x00) {
        return Utf16Guess::BigEndian;
    }

    return Utf16Guess::None;
}

// Whitespace ahead of the declaration is dropped; the parser only accepts
// a declaration at the very start
QString fromPrologue(const QString& text) {
    qsizetype i = 0;
    while (i < text.size() && text.at(i).isSpace()) {
        ++i;
    }
    return text.mid(i);
}

} // anonymous namespace

bool startsWithPrologue(const QString& text) {
    for (qsizetype i = 0; i < text.size(); ++i) {
        if (!text.at(i).isSpace()) {
            return text.mid(i, 5) == QLatin1String("<?xml");
        }
    }
    return false;
}

DecodedText decodeBytes(const QByteArray& bytes) {
    const auto guess = guessUtf16(bytes);

    if (guess != Utf16Guess::None) {
        const auto encoding = guess == Utf16Guess::LittleEndian
            ? QStringConverter::Utf16LE
            : QStringConverter::Utf16BE;

        QStringDecoder decoder(encoding);
        QString text = decoder.decode(bytes);
        if (!decoder.hasError() && startsWithPrologue(text)) {
            return {fromPrologue(text), guess == Utf16Guess::LittleEndian ? "UTF-16LE" : "UTF-16BE"};
        }
    }

    QStringDecoder utf8(QStringConverter::Utf8);
    QString text = utf8.decode(bytes);
    if (startsWithPrologue(text)) {
        text = fromPrologue(text);
    }
    return {text, "UTF-8"};
}

std::optional<QString> declaredEncoding(const QString& text) {
    static const QRegularExpression declaration(
        R"(^\s*<\?xml[^>]*?\bencoding\s*=\s*["']([^"']+)["'])");

    auto match = declaration.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return match.captured(1);
}

} // namespace xmlguard::xml
