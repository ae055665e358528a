#include "envsync/sync/items.hpp"

#include "envsync/diff/json_diff.hpp"
#include "envsync/sync/json_merge.hpp"
#include "envsync/sync/transfer.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

namespace envsync::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

StructuredConfigItem::StructuredConfigItem(fs::path source, fs::path target, const SyncConfiguration& config)
    : source_(std::move(source)), target_(std::move(target)), config_(config) {}

bool StructuredConfigItem::needs_sync() const {
    std::error_code ec;
    if (config_.is_excluded(source_) || !fs::is_regular_file(source_, ec)) {
        return false;
    }
    if (!fs::exists(target_, ec)) {
        return true;
    }
    return !diff::json_documents_equal(source_, target_);
}

SyncResult StructuredConfigItem::synchronize() const {
    auto result = make_result(kKind, source_, config_);

    if (!needs_sync()) {
        result.success = true;
        result.message = "Configuration is already in sync";
        return result;
    }

    std::error_code ec;
    if (!fs::exists(target_, ec)) {
        if (config_.dry_run()) {
            result.success = true;
            result.message = "Would create configuration (dry run)";
            return result;
        }
        auto copied = copy_file_with_metadata(source_, target_);
        if (copied.is_error()) {
            spdlog::error("Copy failed for {}: {}", source_.string(), copied.message());
            result.message = "Failed to create configuration";
            result.error = copied.message();
            return result;
        }
        result.success = true;
        result.changes_made = true;
        result.bytes_transferred = copied.value();
        result.message = "Configuration created from source";
        return result;
    }

    auto source_doc = diff::load_json_document(source_);
    if (source_doc.is_error()) {
        spdlog::warn("Invalid source configuration {}: {}", source_.string(), source_doc.message());
        result.message = "Invalid source configuration";
        result.error = source_doc.message();
        return result;
    }
    auto target_doc = diff::load_json_document(target_);
    if (target_doc.is_error()) {
        spdlog::warn("Invalid target configuration {}: {}", target_.string(), target_doc.message());
        result.message = "Invalid target configuration";
        result.error = target_doc.message();
        return result;
    }

    const json& source_json = source_doc.value();
    const json& target_json = target_doc.value();

    json resolved;
    std::string action;
    switch (config_.resolver().resolve_content()) {
        case ContentResolution::KeepTarget:
            result.success = true;
            result.message = "Kept target configuration";
            return result;
        case ContentResolution::Defer:
            result.success = true;
            result.message = config_.conflict_strategy() == ConflictStrategy::Manual
                                 ? "Skipped: configuration needs manual resolution"
                                 : "Skipped configuration conflict";
            return result;
        case ContentResolution::ReplaceTarget:
            resolved = source_json;
            action = "Configuration replaced with source";
            break;
        case ContentResolution::MergeContent:
            resolved = deep_merge(source_json, target_json);
            result.conflicts_resolved = count_conflicts(source_json, target_json);
            action = "Configuration merged";
            break;
    }

    if (resolved == target_json) {
        result.success = true;
        result.conflicts_resolved = 0;
        result.message = "Configuration is already in sync";
        return result;
    }

    if (config_.dry_run()) {
        result.success = true;
        result.message = "Would update configuration (dry run)";
        return result;
    }

    if (auto backup = create_backup(target_, config_); backup.is_error()) {
        spdlog::error("Backup failed for {}: {}", target_.string(), backup.message());
        result.message = "Failed to back up target configuration";
        result.error = backup.message();
        return result;
    }

    const std::string content = resolved.dump(2) + "\n";
    if (auto written = write_text_file(target_, content); written.is_error()) {
        spdlog::error("Write failed for {}: {}", target_.string(), written.message());
        result.message = "Failed to write configuration";
        result.error = written.message();
        return result;
    }

    spdlog::debug("{}: {}", action, target_.string());
    result.success = true;
    result.changes_made = true;
    result.bytes_transferred = content.size();
    result.message = action;
    return result;
}

} // namespace envsync::sync
