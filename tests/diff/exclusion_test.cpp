#include "envsync/diff/exclusion.hpp"

#include <gtest/gtest.h>

#include <regex>

using envsync::diff::ExclusionFilter;
using envsync::diff::default_exclude_patterns;

TEST(ExclusionFilterTest, DefaultPatternsCoverToolingDirectories) {
    ExclusionFilter filter(default_exclude_patterns(), true);

    EXPECT_TRUE(filter.is_excluded("/work/project/.git"));
    EXPECT_TRUE(filter.is_excluded("/work/project/__pycache__"));
    EXPECT_TRUE(filter.is_excluded("/work/project/module.pyc"));
    EXPECT_TRUE(filter.is_excluded("/work/project/venv"));
    EXPECT_TRUE(filter.is_excluded("/work/project/.coverage.worker1"));
    EXPECT_TRUE(filter.is_excluded("/work/project/htmlcov"));
    EXPECT_TRUE(filter.is_excluded("/work/project/.DS_Store"));

    EXPECT_FALSE(filter.is_excluded("/work/project/main.py"));
    EXPECT_FALSE(filter.is_excluded("/work/project/settings.json"));
    EXPECT_FALSE(filter.is_excluded("/work/project/.gitignore"));
}

TEST(ExclusionFilterTest, HiddenLeafExcludedUnlessIncluded) {
    ExclusionFilter hidden_off({}, false);
    ExclusionFilter hidden_on({}, true);

    EXPECT_TRUE(hidden_off.is_excluded("/work/.profile"));
    EXPECT_FALSE(hidden_on.is_excluded("/work/.profile"));

    // Only the leaf name counts
    EXPECT_FALSE(hidden_off.is_excluded("/work/.config/app/settings.ini"));
}

TEST(ExclusionFilterTest, DotDirectoryNamesAreNotHidden) {
    ExclusionFilter filter(default_exclude_patterns(), false, {".sync_backups"});

    EXPECT_FALSE(filter.is_excluded("."));
    EXPECT_FALSE(filter.is_excluded(".."));
    EXPECT_FALSE(filter.is_excluded("/tmp/work/."));
    EXPECT_FALSE(filter.is_excluded("./src"));
    EXPECT_TRUE(filter.is_excluded("./.hidden"));
}

TEST(ExclusionFilterTest, PatternsUseSearchSemantics) {
    ExclusionFilter filter({"build/", R"(\.log$)"}, true);

    EXPECT_TRUE(filter.is_excluded("/repo/build/output.txt"));
    EXPECT_TRUE(filter.is_excluded("/repo/logs/today.log"));
    EXPECT_FALSE(filter.is_excluded("/repo/logs/today.txt"));
    EXPECT_EQ(filter.pattern_count(), 2u);
}

TEST(ExclusionFilterTest, ReservedNamesAlwaysExcluded) {
    ExclusionFilter filter({}, true, {".sync_backups"});

    EXPECT_TRUE(filter.is_excluded("/data/.sync_backups"));
    EXPECT_FALSE(filter.is_excluded("/data/.sync_backups_old"));
}

TEST(ExclusionFilterTest, InvalidPatternThrows) {
    EXPECT_THROW(ExclusionFilter({"(unclosed"}, false), std::regex_error);
}
