/**
 * XmlGuard - Report Formatter Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ReportFormatter.hpp"

#include <QFile>
#include <QXmlStreamWriter>

namespace xmlguard {

namespace {

const char* STYLE =
    "body { font-family: Arial, sans-serif; margin: 20px; }\n"
    ".error { color: #d32f2f; }\n"
    ".warning { color: #f57c00; }\n"
    ".info { color: #1976d2; }\n"
    "table { border-collapse: collapse; width: 100%; margin: 20px 0; }\n"
    "th, td { border: 1px solid #ddd; padding: 8px; text-align: left; }\n"
    "th { background-color: #f5f5f5; }\n"
    ".summary { background: #e3f2fd; padding: 15px; border-radius: 5px; margin: 20px 0; }\n";

QString severityClass(Severity severity) {
    switch (severity) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
        case Severity::Info:    return "info";
    }
    return "info";
}

void writeParagraph(QXmlStreamWriter& xml, const QString& text) {
    xml.writeTextElement("p", text);
}

void writeResultRow(QXmlStreamWriter& xml, const ValidationResult& result) {
    xml.writeStartElement("tr");
    xml.writeAttribute("class", severityClass(result.severity));

    xml.writeTextElement("td", QString::fromStdString(severityToString(result.severity)));
    xml.writeTextElement("td", result.file.empty() ? QString("-") : QString::fromStdString(result.file));
    xml.writeTextElement("td", QString::fromStdString(result.elementPath));
    xml.writeTextElement("td", QString::fromStdString(result.message));

    xml.writeStartElement("td");
    if (!result.suggestions.empty()) {
        xml.writeStartElement("ul");
        for (const auto& suggestion : result.suggestions) {
            xml.writeTextElement("li", QString::fromStdString(suggestion));
        }
        xml.writeEndElement(); // ul
    }
    xml.writeEndElement(); // td

    xml.writeEndElement(); // tr
}

} // anonymous namespace

QString ReportFormatter::summary(const ValidationReport& report) {
    return QString::fromStdString(report.summary());
}

QString ReportFormatter::toHtml(const ValidationReport& report) {
    QString html;
    QXmlStreamWriter xml(&html);
    xml.setAutoFormatting(true);

    xml.writeDTD("<!DOCTYPE html>");
    xml.writeStartElement("html");

    xml.writeStartElement("head");
    xml.writeEmptyElement("meta");
    xml.writeAttribute("charset", "UTF-8");
    xml.writeTextElement("title", "Data Consistency Report");
    xml.writeTextElement("style", STYLE);
    xml.writeEndElement(); // head

    xml.writeStartElement("body");
    xml.writeTextElement("h1", "Data Consistency Report");

    xml.writeStartElement("div");
    xml.writeAttribute("class", "summary");
    xml.writeTextElement("h2", "Summary");
    writeParagraph(xml, "Validated at: " + report.timestamp().toString("yyyy-MM-dd HH:mm:ss"));
    writeParagraph(xml, QString("Elapsed: %1 ms").arg(report.elapsedMs()));
    writeParagraph(xml, summary(report));
    xml.writeEndElement(); // div

    xml.writeTextElement("h2", "Results");
    for (const auto& [type, results] : report.resultsByType()) {
        xml.writeTextElement("h3", QString("%1 (%2)")
            .arg(QString::fromStdString(type))
            .arg(results.size()));

        xml.writeStartElement("table");
        xml.writeStartElement("tr");
        for (const char* header : {"Severity", "File", "Element", "Message", "Suggestions"}) {
            xml.writeTextElement("th", header);
        }
        xml.writeEndElement(); // tr

        for (const auto& result : results) {
            writeResultRow(xml, result);
        }
        xml.writeEndElement(); // table
    }

    if (!report.skippedRules().empty()) {
        xml.writeTextElement("h2", "Skipped Rules");
        xml.writeStartElement("ul");
        for (const auto& skipped : report.skippedRules()) {
            xml.writeTextElement("li", QString::fromStdString(skipped.name + ": " + skipped.reason));
        }
        xml.writeEndElement(); // ul
    }

    xml.writeEndElement(); // body
    xml.writeEndElement(); // html
    xml.writeEndDocument();

    return html;
}

bool ReportFormatter::writeHtml(const ValidationReport& report, const QString& path,
                                QString* errorMessage) {
    // Report artifact, not game data: plain QFile, no safety layer
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Unbuffered)) {
        if (errorMessage) {
            *errorMessage = file.errorString();
        }
        return false;
    }

    const QByteArray bytes = toHtml(report).toUtf8();
    if (file.write(bytes) != bytes.size()) {
        if (errorMessage) {
            *errorMessage = "Short write: " + file.errorString();
        }
        return false;
    }
    return true;
}

} // namespace xmlguard
