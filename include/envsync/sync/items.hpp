#pragma once

#include "envsync/sync/config.hpp"
#include "envsync/sync/types.hpp"
#include "envsync/vcs/git_client.hpp"

#include <filesystem>
#include <string>
#include <variant>

namespace envsync::sync {

/// True for paths whose content is handled as a structured (JSON) document
bool is_structured_config(const std::filesystem::path& path);

/// Result skeleton with item path, kind and direction filled in
SyncResult make_result(ItemKind kind, const std::filesystem::path& source, const SyncConfiguration& config);

/**
 * @brief A single regular file, copied source to target
 *
 * Source-authoritative: the conflict strategy never changes what a file copy
 * does.
 */
class FileItem {
public:
    static constexpr ItemKind kKind = ItemKind::File;

    FileItem(std::filesystem::path source, std::filesystem::path target, const SyncConfiguration& config);

    const std::filesystem::path& source() const noexcept { return source_; }
    const std::filesystem::path& target() const noexcept { return target_; }

    bool needs_sync() const;
    SyncResult synchronize() const;

private:
    std::filesystem::path source_;
    std::filesystem::path target_;
    const SyncConfiguration& config_;
};

/**
 * @brief A JSON document reconciled according to the conflict strategy
 *
 * A missing target receives the source bytes verbatim. Otherwise both sides
 * are parsed and the strategy decides the resolved document, which is only
 * written when it differs from the current target.
 */
class StructuredConfigItem {
public:
    static constexpr ItemKind kKind = ItemKind::StructuredConfig;

    StructuredConfigItem(std::filesystem::path source, std::filesystem::path target,
                         const SyncConfiguration& config);

    const std::filesystem::path& source() const noexcept { return source_; }
    const std::filesystem::path& target() const noexcept { return target_; }

    bool needs_sync() const;
    SyncResult synchronize() const;

private:
    std::filesystem::path source_;
    std::filesystem::path target_;
    const SyncConfiguration& config_;
};

/**
 * @brief A directory tree; children run on a pool scoped to one synchronize() call
 *
 * Failed children are reported in the aggregate message but do not fail the
 * directory result. Target-only files are removed afterwards unless the
 * strategy keeps the target.
 */
class DirectoryItem {
public:
    static constexpr ItemKind kKind = ItemKind::Directory;

    DirectoryItem(std::filesystem::path source, std::filesystem::path target, const SyncConfiguration& config);

    const std::filesystem::path& source() const noexcept { return source_; }
    const std::filesystem::path& target() const noexcept { return target_; }

    bool needs_sync() const;
    SyncResult synchronize() const;

private:
    std::filesystem::path source_;
    std::filesystem::path target_;
    const SyncConfiguration& config_;
};

/**
 * @brief A git working copy brought to the source's HEAD
 *
 * Clones when the target is missing; otherwise adds the source as remote
 * "source", fetches and hard-resets the target's current branch onto
 * source/<branch>.
 */
class RepositoryItem {
public:
    static constexpr ItemKind kKind = ItemKind::Repository;

    static constexpr const char* kRemoteName = "source";

    RepositoryItem(std::filesystem::path source, std::filesystem::path target,
                   const SyncConfiguration& config, const vcs::GitClient& git);

    const std::filesystem::path& source() const noexcept { return source_; }
    const std::filesystem::path& target() const noexcept { return target_; }

    bool needs_sync() const;
    SyncResult synchronize() const;

private:
    SyncResult fail(SyncResult result, const std::string& message, const Error& error) const;

    std::filesystem::path source_;
    std::filesystem::path target_;
    const SyncConfiguration& config_;
    const vcs::GitClient& git_;
};

using SyncItem = std::variant<FileItem, DirectoryItem, StructuredConfigItem, RepositoryItem>;

ItemKind kind_of(const SyncItem& item);
bool needs_sync(const SyncItem& item);
SyncResult synchronize(const SyncItem& item);

} // namespace envsync::sync
