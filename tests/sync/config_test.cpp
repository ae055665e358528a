#include "envsync/sync/config.hpp"

#include "envsync/core/errors.hpp"
#include "support/test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;
using envsync::ConfigurationError;
using envsync::ErrorCode;
using namespace envsync::sync;
using envsync::testing::TempDir;
using envsync::testing::write_file;

namespace {

SyncOptions make_options() {
    SyncOptions options;
    options.source_root = "/env/dev";
    options.target_root = "/env/prod";
    return options;
}

} // namespace

TEST(SyncConfigurationTest, DefaultsAreSensible) {
    SyncConfiguration config(make_options());

    EXPECT_EQ(config.conflict_strategy(), ConflictStrategy::SourceWins);
    EXPECT_EQ(config.max_workers(), 8u);
    EXPECT_TRUE(config.backup_enabled());
    EXPECT_FALSE(config.dry_run());
    EXPECT_FALSE(config.include_hidden());
    EXPECT_TRUE(config.is_excluded("/env/dev/.git"));
    EXPECT_TRUE(config.is_excluded("/env/dev/.sync_backups"));
}

TEST(SyncConfigurationTest, RejectsInvalidOptions) {
    auto no_workers = make_options();
    no_workers.max_workers = 0;
    EXPECT_THROW(SyncConfiguration{no_workers}, ConfigurationError);

    auto no_source = make_options();
    no_source.source_root.clear();
    EXPECT_THROW(SyncConfiguration{no_source}, ConfigurationError);

    auto bad_pattern = make_options();
    bad_pattern.exclude_patterns = {"[unterminated"};
    EXPECT_THROW(SyncConfiguration{bad_pattern}, ConfigurationError);
}

TEST(SyncConfigurationTest, BackupDirectoryDefaultsToSibling) {
    SyncConfiguration config(make_options());
    EXPECT_EQ(config.backup_directory_for("/env/prod/app/settings.json"),
              fs::path("/env/prod/app/.sync_backups"));

    auto custom = make_options();
    custom.backup_directory = fs::path("/var/backups/envsync");
    SyncConfiguration with_custom(custom);
    EXPECT_EQ(with_custom.backup_directory_for("/env/prod/app/settings.json"),
              fs::path("/var/backups/envsync"));
    EXPECT_TRUE(with_custom.is_excluded("/env/prod/envsync"));
}

TEST(SyncConfigurationTest, LoadsFromJson) {
    json document = {
        {"source_root", "/env/dev"},
        {"target_root", "/env/prod"},
        {"conflict_strategy", "target_wins"},
        {"direction", "source-to-target"},
        {"exclude_patterns", {R"(\.log$)"}},
        {"max_workers", 2},
        {"dry_run", true},
        {"include_hidden", true},
        {"backup_enabled", false},
    };

    auto config = configuration_from_json(document);

    ASSERT_TRUE(config.is_ok()) << config.message();
    EXPECT_EQ(config.value().conflict_strategy(), ConflictStrategy::TargetWins);
    EXPECT_EQ(config.value().direction(), SyncDirection::SourceToTarget);
    EXPECT_EQ(config.value().max_workers(), 2u);
    EXPECT_TRUE(config.value().dry_run());
    EXPECT_TRUE(config.value().include_hidden());
    EXPECT_FALSE(config.value().backup_enabled());
    EXPECT_TRUE(config.value().is_excluded("/env/dev/debug.log"));
    EXPECT_FALSE(config.value().is_excluded("/env/dev/.git"));
}

TEST(SyncConfigurationTest, JsonErrorsAreReported) {
    auto bad_label = configuration_from_json({{"source_root", "/a"}, {"target_root", "/b"},
                                              {"conflict_strategy", "coin-flip"}});
    ASSERT_TRUE(bad_label.is_error());
    EXPECT_EQ(bad_label.error().code, ErrorCode::InvalidArgument);

    auto bad_type = configuration_from_json({{"source_root", "/a"}, {"target_root", "/b"},
                                             {"max_workers", "many"}});
    ASSERT_TRUE(bad_type.is_error());
    EXPECT_EQ(bad_type.error().code, ErrorCode::Parse);

    auto invalid = configuration_from_json({{"source_root", "/a"}, {"target_root", "/b"},
                                            {"max_workers", 0}});
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidArgument);
}

TEST(SyncConfigurationTest, LoadsFromFile) {
    TempDir dir;
    write_file(dir / "envsync.json", R"({"source_root": "/a", "target_root": "/b", "conflict_strategy": "merge"})");

    auto config = load_configuration(dir / "envsync.json");
    ASSERT_TRUE(config.is_ok()) << config.message();
    EXPECT_EQ(config.value().conflict_strategy(), ConflictStrategy::Merge);

    auto missing = load_configuration(dir / "missing.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST(SyncConfigurationTest, OptionsOverlayKeepsBase) {
    auto base = make_options();
    base.max_workers = 3;

    auto overlaid = options_from_json({{"dry_run", true}}, base);

    ASSERT_TRUE(overlaid.is_ok());
    EXPECT_EQ(overlaid.value().max_workers, 3);
    EXPECT_TRUE(overlaid.value().dry_run);
    EXPECT_EQ(overlaid.value().source_root, fs::path("/env/dev"));
}
