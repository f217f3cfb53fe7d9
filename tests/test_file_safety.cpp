/**
 * XmlGuard - File Safety Manager Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "TestSupport.hpp"
#include "safety/AtomicFile.hpp"
#include "safety/FileSafetyManager.hpp"

using namespace xmlguard;
using test::readFile;
using test::writeFile;
using test::xmlContent;

class FileSafetyTest : public test::TempDirTest {
protected:
    std::string auditText() const {
        return readFile(testDir / "audit.log").toStdString();
    }
};

TEST_F(FileSafetyTest, WritesNewFileWithoutBackup) {
    FileSafetyManager safety(safetyConfig());
    auto path = dataFile("items.xml");
    auto content = xmlContent("<items/>");

    auto outcome = safety.safeWrite(path, content);

    EXPECT_EQ(readFile(path), content);
    EXPECT_TRUE(outcome.backups.empty());
    EXPECT_FALSE(outcome.degraded());
    ASSERT_EQ(outcome.affectedPaths.size(), 1u);
    EXPECT_EQ(outcome.affectedPaths[0], safety.canonicalPath(path));
    EXPECT_FALSE(std::filesystem::exists(fileio::tempPathFor(path)));
}

TEST_F(FileSafetyTest, BacksUpPreviousContentOnOverwrite) {
    FileSafetyManager safety(safetyConfig());
    auto path = dataFile("items.xml");
    auto v1 = xmlContent("<items><item id=\"1\"/></items>");
    auto v2 = xmlContent("<items><item id=\"2\"/></items>");

    safety.safeWrite(path, v1);
    auto outcome = safety.safeWrite(path, v2);

    EXPECT_EQ(readFile(path), v2);
    ASSERT_EQ(outcome.backups.size(), 1u);

    const auto& backup = outcome.backups[0];
    EXPECT_EQ(readFile(backup.backupPath), v1);
    EXPECT_EQ(backup.checksum, sha256Hex(v1));
    EXPECT_EQ(backup.size, static_cast<std::uint64_t>(v1.size()));
    EXPECT_EQ(backup.operation, "WRITE");
    EXPECT_EQ(backup.originalPath, safety.canonicalPath(path));
    EXPECT_FALSE(backup.id.empty());
    EXPECT_EQ(backup.backupPath.parent_path(), testDir / "backup" / "items.xml_backups");
}

TEST_F(FileSafetyTest, RejectsInvalidContentAndKeepsFile) {
    FileSafetyManager safety(safetyConfig());
    auto path = dataFile("npcs.xml");
    auto original = xmlContent("<npcs/>");
    writeFile(path, original);

    EXPECT_THROW(safety.safeWrite(path, QByteArray("<npcs>")), DataIntegrityError);
    EXPECT_THROW(safety.safeWrite(path, QByteArray()), DataIntegrityError);

    EXPECT_EQ(readFile(path), original);
    EXPECT_TRUE(safety.getBackupHistory(path).empty());
    EXPECT_NE(auditText().find("WRITE | User: tester | File: " +
                               safety.canonicalPath(path).string() + " | Success: false"),
              std::string::npos);
}

TEST_F(FileSafetyTest, IntegrityErrorCarriesEveryViolation) {
    FileSafetyManager safety(safetyConfig());

    try {
        safety.safeWrite(dataFile("empty.xml"), QByteArray());
        FAIL() << "empty content was accepted";
    } catch (const DataIntegrityError& e) {
        EXPECT_FALSE(e.result().valid);
        EXPECT_EQ(e.result().errors.size(), 3u);
        EXPECT_EQ(e.path(), safety.canonicalPath(dataFile("empty.xml")));
    }
    EXPECT_FALSE(std::filesystem::exists(dataFile("empty.xml")));
}

TEST_F(FileSafetyTest, ReadsExistingFileAndReportsMissing) {
    FileSafetyManager safety(safetyConfig());
    auto content = xmlContent("<skills/>");
    writeFile(dataFile("skills.xml"), content);

    EXPECT_EQ(safety.safeRead(dataFile("skills.xml")), content);
    EXPECT_THROW(safety.safeRead(dataFile("missing.xml")), NotFoundError);
}

TEST_F(FileSafetyTest, WriteIntoMissingDirectoryFails) {
    FileSafetyManager safety(safetyConfig());
    auto path = dataFile("nowhere/items.xml");

    EXPECT_THROW(safety.safeWrite(path, xmlContent("<items/>")), IOFailure);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(FileSafetyTest, RestoresFromBackup) {
    FileSafetyManager safety(safetyConfig());
    auto path = dataFile("quests.xml");
    auto v1 = xmlContent("<quests><quest id=\"1\"/></quests>");
    auto v2 = xmlContent("<quests><quest id=\"2\"/></quests>");

    safety.safeWrite(path, v1);
    auto backup = safety.safeWrite(path, v2).backups.at(0);

    auto outcome = safety.restoreFromBackup(path, backup.timestampToken);
    EXPECT_EQ(readFile(path), v1);
    EXPECT_EQ(sha256Hex(readFile(path)), backup.checksum);

    // The restore backed up v2 first, so it can be undone
    ASSERT_EQ(outcome.backups.size(), 1u);
    EXPECT_EQ(outcome.backups[0].operation, "RESTORE");
    EXPECT_EQ(readFile(outcome.backups[0].backupPath), v2);

    EXPECT_NE(auditText().find("RESTORE | User: tester"), std::string::npos);
}

TEST_F(FileSafetyTest, RestoreOfUnknownBackupThrows) {
    FileSafetyManager safety(safetyConfig());
    auto path = dataFile("quests.xml");
    safety.safeWrite(path, xmlContent("<quests/>"));

    EXPECT_THROW(safety.restoreFromBackup(path, "20000101_000000"), NotFoundError);
    EXPECT_EQ(readFile(path), xmlContent("<quests/>"));
}

TEST_F(FileSafetyTest, AuditsLifecycleAndWrites) {
    {
        FileSafetyManager safety(safetyConfig());
        safety.safeWrite(dataFile("items.xml"), xmlContent("<items/>"));
    }

    auto audit = auditText();
    auto start = audit.find("SYSTEM_START");
    auto write = audit.find("] WRITE | User: tester");
    auto shutdown = audit.find("SYSTEM_SHUTDOWN");

    ASSERT_NE(start, std::string::npos);
    ASSERT_NE(write, std::string::npos);
    ASSERT_NE(shutdown, std::string::npos);
    EXPECT_LT(start, write);
    EXPECT_LT(write, shutdown);
    EXPECT_NE(audit.find("| Success: true"), std::string::npos);
}

TEST_F(FileSafetyTest, AuditFailureIsNotFatal) {
    auto config = safetyConfig();
    // A directory where the log file should be makes every append fail
    std::filesystem::create_directories(config.auditLogPath);

    FileSafetyManager safety(config);
    auto outcome = safety.safeWrite(dataFile("items.xml"), xmlContent("<items/>"));

    EXPECT_EQ(readFile(dataFile("items.xml")), xmlContent("<items/>"));
    ASSERT_TRUE(outcome.degraded());
    EXPECT_EQ(outcome.warnings[0].operation, "AUDIT");
}

TEST_F(FileSafetyTest, EmergencyRollbackRestoresNewestBackup) {
    FileSafetyManager safety(safetyConfig());
    auto items = dataFile("items.xml");
    auto npcs = dataFile("npcs.xml");

    safety.safeWrite(items, xmlContent("<items v=\"1\"/>"));
    safety.safeWrite(items, xmlContent("<items v=\"2\"/>"));
    safety.safeWrite(items, xmlContent("<items v=\"3\"/>"));
    safety.safeWrite(npcs, xmlContent("<npcs v=\"1\"/>"));
    safety.safeWrite(npcs, xmlContent("<npcs v=\"2\"/>"));

    auto outcome = safety.emergencyRollback(QDateTime::currentDateTime().addSecs(1));

    EXPECT_EQ(outcome.affectedPaths.size(), 2u);
    EXPECT_FALSE(outcome.degraded());
    EXPECT_EQ(readFile(items), xmlContent("<items v=\"2\"/>"));
    EXPECT_EQ(readFile(npcs), xmlContent("<npcs v=\"1\"/>"));
    EXPECT_NE(auditText().find("EMERGENCY_ROLLBACK"), std::string::npos);
}

TEST_F(FileSafetyTest, EmergencyRollbackIgnoresLaterBackups) {
    FileSafetyManager safety(safetyConfig());
    auto items = dataFile("items.xml");

    safety.safeWrite(items, xmlContent("<items v=\"1\"/>"));
    safety.safeWrite(items, xmlContent("<items v=\"2\"/>"));

    auto outcome = safety.emergencyRollback(QDateTime::currentDateTime().addDays(-1));

    EXPECT_TRUE(outcome.affectedPaths.empty());
    EXPECT_EQ(readFile(items), xmlContent("<items v=\"2\"/>"));
}

TEST_F(FileSafetyTest, ExecuteBatchCommitsEveryPath) {
    FileSafetyManager safety(safetyConfig());
    std::vector<std::filesystem::path> paths{dataFile("a.xml"), dataFile("b.xml")};
    for (const auto& path : paths) {
        writeFile(path, xmlContent("<data v=\"1\"/>"));
    }

    auto outcome = safety.executeBatch("bump version", paths,
        [&safety](const std::filesystem::path& path, const TransactionPtr& txn) {
            auto content = safety.safeRead(path, txn);
            content.replace("v=\"1\"", "v=\"2\"");
            safety.safeWrite(path, content, txn);
        });

    EXPECT_EQ(outcome.affectedPaths.size(), 2u);
    EXPECT_EQ(outcome.backups.size(), 2u);
    for (const auto& path : paths) {
        EXPECT_EQ(readFile(path), xmlContent("<data v=\"2\"/>"));
    }
    EXPECT_EQ(safety.activeTransaction(), nullptr);
}

TEST_F(FileSafetyTest, ExecuteBatchRollsBackOnFailure) {
    FileSafetyManager safety(safetyConfig());
    auto a = dataFile("a.xml");
    auto b = dataFile("b.xml");
    writeFile(a, xmlContent("<data v=\"1\"/>"));
    writeFile(b, xmlContent("<data v=\"1\"/>"));

    EXPECT_THROW(safety.executeBatch("fails halfway", {a, b},
        [&safety, &b](const std::filesystem::path& path, const TransactionPtr& txn) {
            if (path == b) {
                throw std::runtime_error("operation failed");
            }
            safety.safeWrite(path, xmlContent("<data v=\"2\"/>"), txn);
        }), std::runtime_error);

    EXPECT_EQ(readFile(a), xmlContent("<data v=\"1\"/>"));
    EXPECT_EQ(readFile(b), xmlContent("<data v=\"1\"/>"));
    EXPECT_EQ(safety.activeTransaction(), nullptr);
    EXPECT_NE(auditText().find("ROLLBACK_TRANSACTION"), std::string::npos);
}
