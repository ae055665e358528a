#include "envsync/diff/tree_scan.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <set>

namespace fs = std::filesystem;
using envsync::diff::ExclusionFilter;
using envsync::diff::default_exclude_patterns;
using envsync::diff::list_files;
using envsync::testing::TempDir;
using envsync::testing::write_file;

TEST(TreeScanTest, ListsRegularFilesRelativeToRoot) {
    TempDir root;
    write_file(root / "a.txt", "a");
    write_file(root / "nested/b.txt", "b");
    write_file(root / "nested/deeper/c.json", "{}");
    fs::create_directories(root / "empty");

    auto files = list_files(root.path(), ExclusionFilter(default_exclude_patterns(), false));

    ASSERT_TRUE(files.is_ok());
    EXPECT_EQ(files.value(), (std::set<fs::path>{"a.txt", "nested/b.txt", "nested/deeper/c.json"}));
}

TEST(TreeScanTest, PrunesExcludedDirectories) {
    TempDir root;
    write_file(root / "keep.txt", "k");
    write_file(root / "__pycache__/mod.cpython.pyc", "x");
    write_file(root / "venv/lib/site.py", "x");
    write_file(root / ".hidden/secret.txt", "x");
    write_file(root / ".sync_backups/keep.txt.20240101000000.bak", "x");

    auto files = list_files(root.path(), ExclusionFilter(default_exclude_patterns(), false, {".sync_backups"}));

    ASSERT_TRUE(files.is_ok());
    EXPECT_EQ(files.value(), (std::set<fs::path>{"keep.txt"}));
}

TEST(TreeScanTest, BackupDirectoryHiddenEvenWithIncludeHidden) {
    TempDir root;
    write_file(root / ".profile", "p");
    write_file(root / ".sync_backups/.profile.20240101000000.bak", "p");

    auto files = list_files(root.path(), ExclusionFilter({}, true, {".sync_backups"}));

    ASSERT_TRUE(files.is_ok());
    EXPECT_EQ(files.value(), (std::set<fs::path>{".profile"}));
}

TEST(TreeScanTest, MissingRootIsEmpty) {
    TempDir root;

    auto files = list_files(root / "does-not-exist", ExclusionFilter({}, false));

    ASSERT_TRUE(files.is_ok());
    EXPECT_TRUE(files.value().empty());
}
