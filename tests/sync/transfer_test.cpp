#include "envsync/sync/transfer.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <regex>
#include <string>

namespace fs = std::filesystem;
using namespace envsync::sync;
using envsync::testing::TempDir;
using envsync::testing::read_file;
using envsync::testing::shift_mtime;
using envsync::testing::write_file;

namespace {

SyncConfiguration make_config(const TempDir& dir, bool backups = true) {
    SyncOptions options;
    options.source_root = dir / "source";
    options.target_root = dir / "target";
    options.backup_enabled = backups;
    return SyncConfiguration(options);
}

std::size_t count_entries(const fs::path& directory) {
    std::size_t count = 0;
    for ([[maybe_unused]] const auto& entry : fs::directory_iterator(directory)) {
        ++count;
    }
    return count;
}

} // namespace

TEST(TransferTest, CopyPreservesContentAndModificationTime) {
    TempDir dir;
    write_file(dir / "source/app.cfg", "threads=4\n");
    shift_mtime(dir / "source/app.cfg", std::chrono::seconds(-3600));

    auto copied = copy_file_with_metadata(dir / "source/app.cfg", dir / "target/nested/app.cfg");

    ASSERT_TRUE(copied.is_ok()) << copied.message();
    EXPECT_EQ(copied.value(), 10u);
    EXPECT_EQ(read_file(dir / "target/nested/app.cfg"), "threads=4\n");
    EXPECT_EQ(fs::last_write_time(dir / "target/nested/app.cfg"), fs::last_write_time(dir / "source/app.cfg"));
}

TEST(TransferTest, CopyOverwritesExistingTarget) {
    TempDir dir;
    write_file(dir / "source/a.txt", "new");
    write_file(dir / "target/a.txt", "old content");

    ASSERT_TRUE(copy_file_with_metadata(dir / "source/a.txt", dir / "target/a.txt").is_ok());
    EXPECT_EQ(read_file(dir / "target/a.txt"), "new");
}

TEST(TransferTest, CopyOfMissingSourceFails) {
    TempDir dir;

    auto copied = copy_file_with_metadata(dir / "source/none.txt", dir / "target/none.txt");

    ASSERT_TRUE(copied.is_error());
    EXPECT_EQ(copied.error().code, envsync::ErrorCode::Io);
    EXPECT_FALSE(fs::exists(dir / "target/none.txt"));
}

TEST(TransferTest, BackupUsesTimestampedSiblingName) {
    TempDir dir;
    write_file(dir / "target/settings.json", "{}");
    auto config = make_config(dir);

    auto backup = create_backup(dir / "target/settings.json", config);

    ASSERT_TRUE(backup.is_ok()) << backup.message();
    ASSERT_TRUE(backup.value().has_value());
    const fs::path& path = *backup.value();
    EXPECT_EQ(path.parent_path(), dir / "target/.sync_backups");
    EXPECT_TRUE(std::regex_match(path.filename().string(), std::regex(R"(settings\.json\.\d{14}\.bak)")));
    EXPECT_EQ(read_file(path), "{}");
}

TEST(TransferTest, BackupSkippedWhenDisabledOrMissing) {
    TempDir dir;
    write_file(dir / "target/a.txt", "a");

    auto disabled = create_backup(dir / "target/a.txt", make_config(dir, false));
    ASSERT_TRUE(disabled.is_ok());
    EXPECT_FALSE(disabled.value().has_value());
    EXPECT_FALSE(fs::exists(dir / "target/.sync_backups"));

    auto missing = create_backup(dir / "target/none.txt", make_config(dir));
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value().has_value());
}

TEST(TransferTest, RemoveWithBackupKeepsACopy) {
    TempDir dir;
    write_file(dir / "target/stale.txt", "stale");

    ASSERT_TRUE(remove_with_backup(dir / "target/stale.txt", make_config(dir)).is_ok());

    EXPECT_FALSE(fs::exists(dir / "target/stale.txt"));
    EXPECT_EQ(count_entries(dir / "target/.sync_backups"), 1u);
}

TEST(TransferTest, BackupTimestampHasFourteenDigits) {
    EXPECT_TRUE(std::regex_match(backup_timestamp(), std::regex(R"(\d{14})")));
}
