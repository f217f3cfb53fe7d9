/**
 * XmlGuard - Report and Formatter Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <filesystem>

#include "TestSupport.hpp"
#include "validation/ReportFormatter.hpp"
#include "validation/ValidationReport.hpp"

using namespace xmlguard;

class ReportFormatterTest : public ::testing::Test {
protected:
    void SetUp() override {
        ValidationResult dangling;
        dangling.severity = Severity::Error;
        dangling.type = result_type::DANGLING_REFERENCE;
        dangling.message = "Drop table references unknown item id: <script>alert(1)</script>";
        dangling.file = "drops.xml";
        dangling.elementPath = "/drops/drop[1]";
        dangling.suggestions = {"Check that the item id is correct", "Remove the drop & retry"};

        ValidationResult mismatch;
        mismatch.severity = Severity::Warning;
        mismatch.type = result_type::EXPERIENCE_MISMATCH;
        mismatch.message = "NPC wolf gives too much exp";
        mismatch.file = "npcs.xml";

        ValidationResult orphan;
        orphan.severity = Severity::Info;
        orphan.type = result_type::ORPHANED_DATA;
        orphan.message = "Item 3 is not referenced anywhere";
        orphan.file = "items.xml";

        report.addResults({dangling, mismatch, orphan});
        report.addSkippedRule({"balance-check", "timed out after 100 ms"});
        report.setElapsedMs(42);
    }

    ValidationReport report;
};

TEST_F(ReportFormatterTest, CountsBySeverity) {
    EXPECT_EQ(report.errorCount(), 1);
    EXPECT_EQ(report.warningCount(), 1);
    EXPECT_EQ(report.infoCount(), 1);
    EXPECT_TRUE(report.hasErrors());
}

TEST_F(ReportFormatterTest, GroupsByTypeAndFile) {
    auto byType = report.resultsByType();
    EXPECT_EQ(byType.size(), 3u);
    EXPECT_EQ(byType.at(result_type::DANGLING_REFERENCE).size(), 1u);

    auto byFile = report.resultsByFile();
    EXPECT_EQ(byFile.size(), 3u);
    EXPECT_EQ(byFile.at("npcs.xml")[0].type, result_type::EXPERIENCE_MISMATCH);
}

TEST_F(ReportFormatterTest, RetainIfUpdatesCounts) {
    report.retainIf([](const ValidationResult& r) { return r.severity != Severity::Error; });

    EXPECT_EQ(report.results().size(), 2u);
    EXPECT_EQ(report.errorCount(), 0);
    EXPECT_FALSE(report.hasErrors());
    EXPECT_EQ(report.warningCount(), 1);
}

TEST_F(ReportFormatterTest, SummaryMentionsSkippedRules) {
    EXPECT_EQ(ReportFormatter::summary(report),
              "Validation finished: 1 errors, 1 warnings, 1 info (1 rules skipped)");
}

TEST_F(ReportFormatterTest, HtmlEscapesAndColorsRows) {
    auto html = ReportFormatter::toHtml(report);

    EXPECT_TRUE(html.trimmed().startsWith("<!DOCTYPE html>"));
    EXPECT_FALSE(html.contains("<script>"));
    EXPECT_TRUE(html.contains("&lt;script&gt;"));
    EXPECT_TRUE(html.contains("Remove the drop &amp; retry"));

    EXPECT_TRUE(html.contains("<tr class=\"error\">"));
    EXPECT_TRUE(html.contains("<tr class=\"warning\">"));
    EXPECT_TRUE(html.contains("<tr class=\"info\">"));

    EXPECT_TRUE(html.contains("dangling reference (1)"));
    EXPECT_TRUE(html.contains("Elapsed: 42 ms"));
    EXPECT_TRUE(html.contains("balance-check: timed out after 100 ms"));
}

TEST(ReportFormatterEmptyTest, EmptyReportHasNoTables) {
    ValidationReport empty;
    auto html = ReportFormatter::toHtml(empty);

    EXPECT_FALSE(html.contains("<table>"));
    EXPECT_FALSE(html.contains("Skipped Rules"));
    EXPECT_TRUE(html.contains("Validation finished: 0 errors, 0 warnings, 0 info"));
}

class ReportFileTest : public test::TempDirTest {};

TEST_F(ReportFileTest, WritesWholeHtmlReport) {
    ValidationReport report;
    report.addSkippedRule({"orphaned-data", "timed out after 100 ms"});

    const auto path = testDir / "report.html";
    QString error;
    ASSERT_TRUE(ReportFormatter::writeHtml(report, QString::fromStdString(path.string()), &error))
        << error.toStdString();

    EXPECT_EQ(test::readFile(path), ReportFormatter::toHtml(report).toUtf8());
}

TEST_F(ReportFileTest, FailsWhenFileCannotBeOpened) {
    ValidationReport report;
    QString error;

    EXPECT_FALSE(ReportFormatter::writeHtml(report, QString::fromStdString(testDir.string()), &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(ReportFileTest, FailsWhenDeviceIsFull) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }

    ValidationReport report;
    QString error;

    EXPECT_FALSE(ReportFormatter::writeHtml(report, "/dev/full", &error));
    EXPECT_TRUE(error.startsWith("Short write"));
}
