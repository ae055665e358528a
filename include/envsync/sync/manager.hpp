#pragma once

#include "envsync/core/result.hpp"
#include "envsync/sync/config.hpp"
#include "envsync/sync/items.hpp"
#include "envsync/sync/types.hpp"
#include "envsync/vcs/command_runner.hpp"
#include "envsync/vcs/git_client.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <vector>

namespace envsync::sync {

/**
 * @brief Pick the item kind for a path
 *
 * Git working copy (has a .git directory) before directory before JSON
 * document; anything else is a plain file.
 */
ItemKind classify(const std::filesystem::path& path);

/**
 * @brief Drives top-level synchronization and keeps the result log
 *
 * Sequential: every sync_path() call runs to completion before returning,
 * and its result is appended to the log, followed by one entry per failed
 * directory child. Parallelism happens inside directory items.
 */
class SyncManager {
public:
    /// Runs git through a ProcessRunner owned by the manager
    explicit SyncManager(SyncConfiguration config);

    /// Runs git through the given runner, which must outlive the manager
    SyncManager(SyncConfiguration config, const vcs::CommandRunner& runner);

    SyncManager(const SyncManager&) = delete;
    SyncManager& operator=(const SyncManager&) = delete;

    /// Synchronize one source path onto one target path
    SyncResult sync_path(const std::filesystem::path& source, const std::filesystem::path& target);

    /// Synchronize the configured source root onto the configured target root
    SyncResult run();

    SyncItem make_item(const std::filesystem::path& source, const std::filesystem::path& target) const;

    const std::vector<SyncResult>& results() const noexcept { return results_; }
    SyncSummary summary() const;

    const SyncConfiguration& configuration() const noexcept { return config_; }

private:
    SyncConfiguration config_;
    std::unique_ptr<vcs::CommandRunner> owned_runner_;
    const vcs::CommandRunner& runner_;
    vcs::GitClient git_;
    std::vector<SyncResult> results_;
};

SyncSummary summarize(const std::vector<SyncResult>& results);

nlohmann::json result_to_json(const SyncResult& result);

/// Timestamp, per-item entries and the summary
nlohmann::json results_to_json(const std::vector<SyncResult>& results);

Result<void> write_status_report(const std::filesystem::path& path, const std::vector<SyncResult>& results);

/**
 * @brief One-call synchronization of options.source_root onto options.target_root
 *
 * @throws ConfigurationError if the options do not validate
 */
std::vector<SyncResult> synchronize_environments(SyncOptions options);

/// Options used by synchronize_environments() when the caller has no preference
SyncOptions environment_defaults(std::filesystem::path source_root, std::filesystem::path target_root);

} // namespace envsync::sync
