#pragma once

#include "envsync/core/result.hpp"
#include "envsync/diff/exclusion.hpp"
#include "envsync/sync/conflict.hpp"
#include "envsync/sync/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace envsync::sync {

/// Default backup location, created beside the path being replaced or removed
inline constexpr const char* kBackupDirectoryName = ".sync_backups";

/**
 * @brief Caller-facing knobs for one synchronization run
 *
 * Plain aggregate; validation happens when a SyncConfiguration is built
 * from it.
 */
struct SyncOptions {
    std::filesystem::path source_root;
    std::filesystem::path target_root;
    SyncDirection direction = SyncDirection::Bidirectional;
    ConflictStrategy conflict_strategy = ConflictStrategy::SourceWins;
    std::vector<std::string> exclude_patterns = diff::default_exclude_patterns();
    int max_workers = 8;
    bool dry_run = false;
    bool verbose = false;
    bool include_hidden = false;
    bool backup_enabled = true;
    std::optional<std::filesystem::path> backup_directory;
};

/**
 * @brief Validated, immutable view of SyncOptions shared by every item of a run
 *
 * Construction compiles the exclusion patterns once. The backup directory
 * name (default or custom) is reserved and never takes part in listings.
 */
class SyncConfiguration {
public:
    /**
     * @throws ConfigurationError on empty roots, max_workers < 1 or an invalid pattern
     */
    explicit SyncConfiguration(SyncOptions options);

    const std::filesystem::path& source_root() const noexcept { return options_.source_root; }
    const std::filesystem::path& target_root() const noexcept { return options_.target_root; }
    SyncDirection direction() const noexcept { return options_.direction; }
    ConflictStrategy conflict_strategy() const noexcept { return options_.conflict_strategy; }
    const std::vector<std::string>& exclude_patterns() const noexcept { return options_.exclude_patterns; }
    std::size_t max_workers() const noexcept { return static_cast<std::size_t>(options_.max_workers); }
    bool dry_run() const noexcept { return options_.dry_run; }
    bool verbose() const noexcept { return options_.verbose; }
    bool include_hidden() const noexcept { return options_.include_hidden; }
    bool backup_enabled() const noexcept { return options_.backup_enabled; }
    const std::optional<std::filesystem::path>& backup_directory() const noexcept {
        return options_.backup_directory;
    }

    const SyncOptions& options() const noexcept { return options_; }
    const diff::ExclusionFilter& filter() const noexcept { return filter_; }
    ConflictResolver resolver() const noexcept { return ConflictResolver(options_.conflict_strategy); }

    [[nodiscard]] bool is_excluded(const std::filesystem::path& path) const { return filter_.is_excluded(path); }

    /// Where a backup of path goes: the configured directory, else a sibling .sync_backups
    std::filesystem::path backup_directory_for(const std::filesystem::path& path) const;

private:
    SyncOptions options_;
    diff::ExclusionFilter filter_;
};

/**
 * @brief Overlay the keys present in a JSON object onto base
 *
 * Recognised keys: source_root, target_root, direction, conflict_strategy,
 * exclude_patterns, max_workers, dry_run, verbose, include_hidden,
 * backup_enabled, backup_directory. Unknown keys are ignored.
 */
Result<SyncOptions> options_from_json(const nlohmann::json& document, SyncOptions base = {});

/// Read a JSON file and overlay it onto base
Result<SyncOptions> load_options(const std::filesystem::path& path, SyncOptions base = {});

/// options_from_json followed by validation; a ConfigurationError becomes an InvalidArgument error
Result<SyncConfiguration> configuration_from_json(const nlohmann::json& document);

Result<SyncConfiguration> load_configuration(const std::filesystem::path& path);

} // namespace envsync::sync
