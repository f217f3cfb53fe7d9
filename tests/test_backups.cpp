/**
 * XmlGuard - Backup Store Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <algorithm>

#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "safety/BackupStore.hpp"
#include "safety/FileSafetyManager.hpp"

using namespace xmlguard;
using test::readFile;
using test::writeFile;
using test::xmlContent;

class BackupStoreTest : public test::TempDirTest {
protected:
    QByteArray version(int n) const {
        return xmlContent("<config version=\"" + std::to_string(n) + "\"/>");
    }
};

TEST_F(BackupStoreTest, KeepsOnlyConfiguredNumberOfVersions) {
    FileSafetyManager safety(safetyConfig(2));
    auto path = dataFile("c.xml");

    safety.safeWrite(path, version(0));
    safety.safeWrite(path, version(1));
    safety.safeWrite(path, version(2));
    safety.safeWrite(path, version(3));

    auto history = safety.getBackupHistory(path);
    ASSERT_EQ(history.size(), 2u);

    // Newest first: the two most recent previous versions survive
    EXPECT_EQ(readFile(history[0].backupPath), version(2));
    EXPECT_EQ(readFile(history[1].backupPath), version(1));
    EXPECT_EQ(readFile(path), version(3));
}

TEST_F(BackupStoreTest, ThreeWritesWithRetentionTwo) {
    FileSafetyManager safety(safetyConfig(2));
    auto path = dataFile("c.xml");

    safety.safeWrite(path, version(1));
    safety.safeWrite(path, version(2));
    safety.safeWrite(path, version(3));

    auto history = safety.getBackupHistory(path);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(readFile(history[0].backupPath), version(2));
    EXPECT_EQ(readFile(history[1].backupPath), version(1));
}

TEST_F(BackupStoreTest, HistoryCarriesChecksumsAndIds) {
    FileSafetyManager safety(safetyConfig());
    auto path = dataFile("items.xml");

    safety.safeWrite(path, version(1));
    auto written = safety.safeWrite(path, version(2)).backups.at(0);

    auto history = safety.getBackupHistory(path);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].id, written.id);
    EXPECT_EQ(history[0].checksum, sha256Hex(version(1)));
    EXPECT_EQ(history[0].operation, "WRITE");
    EXPECT_EQ(history[0].timestampToken, written.timestampToken);
    EXPECT_EQ(history[0].originalPath, safety.canonicalPath(path));
}

TEST_F(BackupStoreTest, BackupRoundTripPreservesChecksum) {
    FileSafetyManager safety(safetyConfig());
    auto path = dataFile("skills.xml");

    safety.safeWrite(path, version(1));
    safety.safeWrite(path, version(2));
    auto backup = safety.getBackupHistory(path).at(0);

    safety.restoreFromBackup(path, backup.timestampToken);
    EXPECT_EQ(sha256Hex(readFile(path)), backup.checksum);
}

TEST_F(BackupStoreTest, SameSecondBackupsGetSequenceSuffix) {
    BackupStore store(testDir / "backup", 10);
    auto original = dataFile("npcs.xml");
    std::vector<NonFatalIssue> warnings;

    auto first = store.createBackup(original, version(1), "WRITE", warnings);
    auto second = store.createBackup(original, version(2), "WRITE", warnings);
    auto third = store.createBackup(original, version(3), "WRITE", warnings);

    EXPECT_TRUE(warnings.empty());
    EXPECT_NE(first.backupPath, second.backupPath);
    EXPECT_NE(second.backupPath, third.backupPath);
    EXPECT_EQ(first.timestampToken.size(), 15u);

    auto history = store.history(original);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].id, third.id);
    EXPECT_EQ(history[2].id, first.id);

    auto found = store.find(original, second.timestampToken);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(readFile(found->backupPath), version(2));
    EXPECT_FALSE(store.find(original, "19990101_000000").has_value());
}

TEST_F(BackupStoreTest, WritesDirectoryIndex) {
    BackupStore store(testDir / "backup", 10);
    auto original = dataFile("quests.xml");
    std::vector<NonFatalIssue> warnings;

    auto record = store.createBackup(original, version(1), "COMMIT", warnings);

    auto indexPath = store.directoryFor(original) / BackupStore::INDEX_FILE;
    auto index = nlohmann::json::parse(readFile(indexPath).toStdString());
    ASSERT_TRUE(index.is_array());
    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index[0]["id"], record.id);
    EXPECT_EQ(index[0]["operation"], "COMMIT");
    EXPECT_EQ(index[0]["checksum"], sha256Hex(version(1)));
    EXPECT_EQ(index[0]["backupFile"], record.backupPath.filename().string());
}

TEST_F(BackupStoreTest, SameFileNameInDifferentDirectoriesStaysSeparate) {
    BackupStore store(testDir / "backup", 1);
    auto first = dataFile("zone1/npcs.xml");
    auto second = dataFile("zone2/npcs.xml");
    std::vector<NonFatalIssue> warnings;

    store.createBackup(first, version(1), "WRITE", warnings);
    store.createBackup(second, version(2), "WRITE", warnings);
    store.createBackup(second, version(3), "WRITE", warnings);

    auto firstHistory = store.history(first);
    auto secondHistory = store.history(second);
    ASSERT_EQ(firstHistory.size(), 1u);
    ASSERT_EQ(secondHistory.size(), 1u);
    EXPECT_EQ(readFile(firstHistory[0].backupPath), version(1));
    EXPECT_EQ(readFile(secondHistory[0].backupPath), version(3));
}

TEST_F(BackupStoreTest, ListsIndexedBackupsNewestFirst) {
    BackupStore store(testDir / "backup", 10);
    std::vector<NonFatalIssue> warnings;

    auto oldest = store.createBackup(dataFile("items.xml"), version(1), "WRITE", warnings);
    store.createBackup(dataFile("npcs.xml"), version(2), "WRITE", warnings);
    auto newest = store.createBackup(dataFile("items.xml"), version(3), "WRITE", warnings);

    // A backup nobody indexed has no known original
    writeFile(store.directoryFor(dataFile("items.xml")) / "items.xml.20000101_000000.bak", version(0));

    auto all = store.allIndexedBackups();
    ASSERT_EQ(all.size(), 3u);
    auto position = [&all](const std::string& id) {
        return std::find_if(all.begin(), all.end(),
                            [&id](const BackupRecord& r) { return r.id == id; }) - all.begin();
    };
    EXPECT_LT(position(newest.id), position(oldest.id));
    EXPECT_EQ(all.back().timestamp, oldest.timestamp);
    for (std::size_t i = 1; i < all.size(); ++i) {
        EXPECT_GE(all[i - 1].timestamp, all[i].timestamp);
    }
}

TEST_F(BackupStoreTest, CorruptIndexIsReportedNotFatal) {
    BackupStore store(testDir / "backup", 10);
    auto original = dataFile("items.xml");
    writeFile(store.directoryFor(original) / BackupStore::INDEX_FILE, "{ broken");

    std::vector<NonFatalIssue> warnings;
    auto record = store.createBackup(original, version(1), "WRITE", warnings);

    EXPECT_TRUE(std::filesystem::exists(record.backupPath));
    ASSERT_FALSE(warnings.empty());
    EXPECT_EQ(warnings[0].operation, "BACKUP_INDEX");
}
