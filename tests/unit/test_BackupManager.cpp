#include <gtest/gtest.h>
#include "backup/BackupManager.hpp"
#include "preview/DeltaPreview.hpp"
#include "types/SyncError.hpp"
#include "TestHelpers.hpp"

#include <sstream>

namespace fs = std::filesystem;
using namespace mg::backup;
using namespace mg::types;
using namespace mg::test;

class BackupManagerTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path dst, backups;
    mg::process::ForkExecRunner runner;

    void SetUp() override {
        dst = tmp / "mirror";
        backups = tmp / "backups";
        fs::create_directories(dst);
        fs::create_directories(backups);
    }
};

TEST_F(BackupManagerTest, SnapshotHoldsEveryFileWithMatchingSizes) {
    writeFile(dst / "a.txt", 10);
    writeFile(dst / ".hidden", 20);
    writeFile(dst / "deep" / "b.bin", 4096);
    setMtime(dst / "a.txt", 1'600'000'000);

    const BackupManager manager(runner, backups);
    const auto record = manager.snapshot(dst);

    ASSERT_TRUE(record.exists());
    EXPECT_EQ(record.origin_path, dst);
    EXPECT_EQ(record.backup_path.parent_path(), backups);
    EXPECT_TRUE(record.backup_path.filename().string().starts_with("mirror."));

    const auto original = mg::preview::enumerate(dst);
    const auto copied = mg::preview::enumerate(record.backup_path);
    ASSERT_EQ(copied.size(), 3u);
    EXPECT_EQ(copied, original);
}

TEST_F(BackupManagerTest, CandidateNameCarriesBasenameTimestampAndSuffix) {
    const BackupManager manager(runner, backups);
    const auto name = manager.candidatePath("/srv/www/").filename().string();

    std::vector<std::string> parts;
    std::stringstream ss(name);
    for (std::string part; std::getline(ss, part, '.');) parts.push_back(part);

    ASSERT_EQ(parts.size(), 3u) << name;
    EXPECT_EQ(parts[0], "www");
    EXPECT_EQ(parts[1].size(), 18u);     // YYYYmmddTHHMMSSmmm
    EXPECT_EQ(parts[1][8], 'T');
    EXPECT_EQ(parts[2].size(), 6u);
}

TEST_F(BackupManagerTest, DefaultsToSystemTempDirectory) {
    const BackupManager manager(runner);
    EXPECT_EQ(manager.tempRoot(), fs::temp_directory_path());
}

TEST_F(BackupManagerTest, BackupDirectoryIsOwnerOnly) {
    writeFile(dst / "a.txt", 1);
    const BackupManager manager(runner, backups);
    const auto record = manager.snapshot(dst);

    const auto perms = fs::status(record.backup_path).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST_F(BackupManagerTest, MissingDestinationYieldsNoneSentinel) {
    const BackupManager manager(runner, backups);
    const auto record = manager.snapshot(tmp / "absent");
    EXPECT_FALSE(record.exists());
    EXPECT_EQ(record.location(), "(none)");
    EXPECT_TRUE(fs::is_empty(backups));
}

TEST_F(BackupManagerTest, EmptyDestinationStillGetsABackup) {
    const BackupManager manager(runner, backups);
    const auto record = manager.snapshot(dst);
    ASSERT_TRUE(record.exists());
    EXPECT_TRUE(fs::is_empty(record.backup_path));
}

TEST_F(BackupManagerTest, ConsecutiveSnapshotsNeverCollide) {
    writeFile(dst / "a.txt", 1);
    const BackupManager manager(runner, backups);
    const auto first = manager.snapshot(dst);
    const auto second = manager.snapshot(dst);
    EXPECT_NE(first.backup_path, second.backup_path);
}

TEST_F(BackupManagerTest, CopyFailureIsBackupFailed) {
    RecordingRunner failing;
    failing.statuses = {1};
    const BackupManager manager(failing, backups);
    try {
        manager.snapshot(dst);
        FAIL() << "expected BackupFailed";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BackupFailed);
    }
    ASSERT_EQ(failing.ran.size(), 1u);
    EXPECT_EQ(failing.ran[0].argv()[0], "cp");
    EXPECT_EQ(failing.ran[0].argv()[1], "-a");
}

TEST_F(BackupManagerTest, UnusableTempRootIsBackupFailed) {
    writeFile(tmp / "not-a-dir", 1);
    const BackupManager manager(runner, tmp / "not-a-dir");
    EXPECT_THROW(manager.snapshot(dst), SyncError);
}
