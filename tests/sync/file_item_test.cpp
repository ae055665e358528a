#include "envsync/sync/items.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace fs = std::filesystem;
using namespace envsync::sync;
using envsync::testing::TempDir;
using envsync::testing::read_file;
using envsync::testing::shift_mtime;
using envsync::testing::write_file;

namespace {

SyncOptions options_for(const TempDir& dir) {
    SyncOptions options;
    options.source_root = dir / "source";
    options.target_root = dir / "target";
    return options;
}

} // namespace

TEST(FileItemTest, CopiesMissingTarget) {
    TempDir dir;
    write_file(dir / "source/notes.txt", "hello\n");
    SyncConfiguration config(options_for(dir));
    FileItem item(dir / "source/notes.txt", dir / "target/sub/notes.txt", config);

    ASSERT_TRUE(item.needs_sync());
    auto result = item.synchronize();

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.changes_made);
    EXPECT_EQ(result.item_kind, ItemKind::File);
    EXPECT_EQ(result.bytes_transferred, 6u);
    EXPECT_EQ(result.item_path, (dir / "source/notes.txt").string());
    EXPECT_EQ(read_file(dir / "target/sub/notes.txt"), "hello\n");
}

TEST(FileItemTest, SecondRunIsNoOp) {
    TempDir dir;
    write_file(dir / "source/notes.txt", "hello\n");
    SyncConfiguration config(options_for(dir));
    FileItem item(dir / "source/notes.txt", dir / "target/notes.txt", config);

    ASSERT_TRUE(item.synchronize().changes_made);
    EXPECT_FALSE(item.needs_sync());

    auto again = item.synchronize();
    EXPECT_TRUE(again.success);
    EXPECT_FALSE(again.changes_made);
    EXPECT_EQ(again.message, "File is already in sync");
}

TEST(FileItemTest, DryRunLeavesTargetUntouched) {
    TempDir dir;
    write_file(dir / "source/notes.txt", "new text\n");
    write_file(dir / "target/notes.txt", "old\n");
    auto options = options_for(dir);
    options.dry_run = true;
    SyncConfiguration config(options);

    auto result = FileItem(dir / "source/notes.txt", dir / "target/notes.txt", config).synchronize();

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.changes_made);
    EXPECT_EQ(result.message, "Would synchronize file (dry run)");
    EXPECT_EQ(read_file(dir / "target/notes.txt"), "old\n");
    EXPECT_FALSE(fs::exists(dir / "target/.sync_backups"));
}

TEST(FileItemTest, ReplacedTargetIsBackedUp) {
    TempDir dir;
    write_file(dir / "source/notes.txt", "version 2\n");
    write_file(dir / "target/notes.txt", "version 1\n");
    shift_mtime(dir / "target/notes.txt", std::chrono::seconds(-600));
    SyncConfiguration config(options_for(dir));

    auto result = FileItem(dir / "source/notes.txt", dir / "target/notes.txt", config).synchronize();

    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(read_file(dir / "target/notes.txt"), "version 2\n");

    std::size_t backups = 0;
    for (const auto& entry : fs::directory_iterator(dir / "target/.sync_backups")) {
        EXPECT_EQ(read_file(entry.path()), "version 1\n");
        ++backups;
    }
    EXPECT_EQ(backups, 1u);
}

TEST(FileItemTest, SourceWinsRegardlessOfStrategy) {
    TempDir dir;
    write_file(dir / "source/notes.txt", "from source\n");
    write_file(dir / "target/notes.txt", "from target\n");
    shift_mtime(dir / "target/notes.txt", std::chrono::seconds(-600));
    auto options = options_for(dir);
    options.conflict_strategy = ConflictStrategy::TargetWins;
    options.backup_enabled = false;
    SyncConfiguration config(options);

    auto result = FileItem(dir / "source/notes.txt", dir / "target/notes.txt", config).synchronize();

    EXPECT_TRUE(result.changes_made);
    EXPECT_EQ(read_file(dir / "target/notes.txt"), "from source\n");
}

TEST(FileItemTest, ExcludedOrMissingSourceIsNoOp) {
    TempDir dir;
    write_file(dir / "source/module.pyc", "bytecode");
    SyncConfiguration config(options_for(dir));

    auto excluded = FileItem(dir / "source/module.pyc", dir / "target/module.pyc", config).synchronize();
    EXPECT_TRUE(excluded.success);
    EXPECT_FALSE(excluded.changes_made);
    EXPECT_FALSE(fs::exists(dir / "target/module.pyc"));

    auto missing = FileItem(dir / "source/gone.txt", dir / "target/gone.txt", config).synchronize();
    EXPECT_TRUE(missing.success);
    EXPECT_FALSE(missing.changes_made);
}

TEST(FileItemTest, EqualSizeAndCloseMtimeNeedsNoSync) {
    TempDir dir;
    write_file(dir / "source/notes.txt", "abc\n");
    write_file(dir / "target/notes.txt", "xyz\n");
    fs::last_write_time(dir / "target/notes.txt", fs::last_write_time(dir / "source/notes.txt"));
    SyncConfiguration config(options_for(dir));

    EXPECT_FALSE(FileItem(dir / "source/notes.txt", dir / "target/notes.txt", config).needs_sync());
}
