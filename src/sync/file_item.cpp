#include "envsync/sync/items.hpp"

#include "envsync/diff/file_diff.hpp"
#include "envsync/sync/transfer.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

namespace envsync::sync {
namespace fs = std::filesystem;

FileItem::FileItem(fs::path source, fs::path target, const SyncConfiguration& config)
    : source_(std::move(source)), target_(std::move(target)), config_(config) {}

bool FileItem::needs_sync() const {
    std::error_code ec;
    if (config_.is_excluded(source_) || !fs::is_regular_file(source_, ec)) {
        return false;
    }
    if (!fs::exists(target_, ec)) {
        return true;
    }
    return !diff::files_equal(source_, target_);
}

SyncResult FileItem::synchronize() const {
    auto result = make_result(kKind, source_, config_);

    if (!needs_sync()) {
        result.success = true;
        result.message = "File is already in sync";
        return result;
    }

    if (config_.dry_run()) {
        result.success = true;
        result.message = "Would synchronize file (dry run)";
        return result;
    }

    if (auto backup = create_backup(target_, config_); backup.is_error()) {
        spdlog::error("Backup failed for {}: {}", target_.string(), backup.message());
        result.message = "Failed to back up target file";
        result.error = backup.message();
        return result;
    }

    auto copied = copy_file_with_metadata(source_, target_);
    if (copied.is_error()) {
        spdlog::error("Copy failed for {}: {}", source_.string(), copied.message());
        result.message = "Failed to synchronize file";
        result.error = copied.message();
        return result;
    }

    spdlog::debug("Copied {} -> {} ({} bytes)", source_.string(), target_.string(), copied.value());
    result.success = true;
    result.changes_made = true;
    result.bytes_transferred = copied.value();
    result.message = "File synchronized";
    return result;
}

} // namespace envsync::sync
