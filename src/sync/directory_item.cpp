#include "envsync/sync/items.hpp"

#include "envsync/diff/tree_scan.hpp"
#include "envsync/pool/task_pool.hpp"
#include "envsync/sync/transfer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace envsync::sync {
namespace fs = std::filesystem;

namespace {

struct TreePlan {
    std::vector<fs::path> to_add;
    std::vector<fs::path> to_update;
    std::vector<fs::path> to_remove;
};

TreePlan plan_trees(const std::set<fs::path>& source_files, const std::set<fs::path>& target_files) {
    TreePlan plan;
    std::set_difference(source_files.begin(), source_files.end(),
                        target_files.begin(), target_files.end(),
                        std::back_inserter(plan.to_add));
    std::set_intersection(source_files.begin(), source_files.end(),
                          target_files.begin(), target_files.end(),
                          std::back_inserter(plan.to_update));
    std::set_difference(target_files.begin(), target_files.end(),
                        source_files.begin(), source_files.end(),
                        std::back_inserter(plan.to_remove));
    return plan;
}

SyncItem make_child(const fs::path& source, const fs::path& target, const SyncConfiguration& config) {
    if (is_structured_config(source)) {
        return StructuredConfigItem(source, target, config);
    }
    return FileItem(source, target, config);
}

} // namespace

DirectoryItem::DirectoryItem(fs::path source, fs::path target, const SyncConfiguration& config)
    : source_(std::move(source)), target_(std::move(target)), config_(config) {}

bool DirectoryItem::needs_sync() const {
    std::error_code ec;
    if (config_.is_excluded(source_) || !fs::is_directory(source_, ec)) {
        return false;
    }

    auto source_files = diff::list_files(source_, config_.filter());
    auto target_files = diff::list_files(target_, config_.filter());
    if (source_files.is_error() || target_files.is_error()) {
        return true;
    }

    const auto plan = plan_trees(source_files.value(), target_files.value());
    if (!plan.to_add.empty()) {
        return true;
    }
    if (!plan.to_remove.empty() && config_.resolver().allows_target_deletion()) {
        return true;
    }
    return std::any_of(plan.to_update.begin(), plan.to_update.end(), [this](const fs::path& relative) {
        return sync::needs_sync(make_child(source_ / relative, target_ / relative, config_));
    });
}

SyncResult DirectoryItem::synchronize() const {
    auto result = make_result(kKind, source_, config_);

    std::error_code ec;
    if (config_.is_excluded(source_)) {
        result.success = true;
        result.message = "Directory is excluded";
        return result;
    }
    if (!fs::is_directory(source_, ec)) {
        result.success = true;
        result.message = "Source directory does not exist";
        return result;
    }

    auto source_files = diff::list_files(source_, config_.filter());
    if (source_files.is_error()) {
        result.message = "Failed to list source directory";
        result.error = source_files.message();
        return result;
    }
    auto target_files = diff::list_files(target_, config_.filter());
    if (target_files.is_error()) {
        result.message = "Failed to list target directory";
        result.error = target_files.message();
        return result;
    }

    const auto plan = plan_trees(source_files.value(), target_files.value());
    if (config_.verbose()) {
        spdlog::info("{}: {} to add, {} to update, {} to remove",
                     source_.string(), plan.to_add.size(), plan.to_update.size(), plan.to_remove.size());
    }

    if (config_.dry_run()) {
        result.success = true;
        result.message = "Would synchronize directory (" + std::to_string(plan.to_add.size()) + " to add, " +
                         std::to_string(plan.to_update.size()) + " to update, " +
                         std::to_string(plan.to_remove.size()) + " to remove)";
        return result;
    }

    fs::create_directories(target_, ec);
    if (ec && !fs::is_directory(target_)) {
        result.message = "Failed to create target directory";
        result.error = ec.message();
        return result;
    }

    struct Submitted {
        fs::path relative;
        ItemKind kind;
        bool update;
    };
    std::unordered_map<pool::TaskId, Submitted> submitted;
    std::vector<pool::TaskId> ids;
    std::unordered_map<pool::TaskId, pool::TaskResult<SyncResult>> outcomes;
    {
        pool::TaskPool<SyncResult> workers(config_.max_workers());

        auto submit = [&](const fs::path& relative, SyncItem child, bool update) {
            const auto kind = kind_of(child);
            const auto id = workers.submit([child = std::move(child)]() { return sync::synchronize(child); },
                                           pool::TaskPriority::Normal);
            submitted.emplace(id, Submitted{relative, kind, update});
            ids.push_back(id);
        };

        for (const auto& relative : plan.to_add) {
            submit(relative, make_child(source_ / relative, target_ / relative, config_), false);
        }
        for (const auto& relative : plan.to_update) {
            auto child = make_child(source_ / relative, target_ / relative, config_);
            if (sync::needs_sync(child)) {
                submit(relative, std::move(child), true);
            }
        }

        outcomes = workers.wait_all(ids);
        workers.shutdown(true);
    }

    std::size_t added = 0;
    std::size_t updated = 0;
    for (const auto id : ids) {
        const auto& outcome = outcomes.at(id);
        const auto& entry = submitted.at(id);
        if (!outcome.success) {
            auto failed = make_result(entry.kind, source_ / entry.relative, config_);
            failed.message = "Synchronization task failed";
            failed.error = outcome.error;
            result.failed_children.push_back(std::move(failed));
            continue;
        }
        const SyncResult& child = *outcome.value;
        if (!child.success) {
            result.failed_children.push_back(child);
            continue;
        }
        if (child.changes_made && entry.update) {
            ++updated;
        } else if (child.changes_made) {
            ++added;
        }
        result.changes_made = result.changes_made || child.changes_made;
        result.bytes_transferred += child.bytes_transferred;
        result.conflicts_resolved += child.conflicts_resolved;
    }

    std::size_t removed = 0;
    if (config_.resolver().allows_target_deletion()) {
        for (const auto& relative : plan.to_remove) {
            const auto path = target_ / relative;
            if (auto res = remove_with_backup(path, config_); res.is_error()) {
                auto failed = make_result(ItemKind::File, path, config_);
                failed.message = "Failed to remove target file";
                failed.error = res.message();
                result.failed_children.push_back(std::move(failed));
                continue;
            }
            spdlog::debug("Removed {}", path.string());
            ++removed;
        }
    }
    if (removed > 0) {
        result.changes_made = true;
    }

    for (const auto& failed : result.failed_children) {
        spdlog::warn("Failed to synchronize {}: {}", failed.item_path, failed.error.value_or(failed.message));
    }

    std::ostringstream message;
    message << "Directory synchronized (" << added << " added, " << updated
            << " updated, " << removed << " removed)";
    if (!result.failed_children.empty()) {
        message << "; " << result.failed_children.size() << " failed:";
        for (const auto& failed : result.failed_children) {
            message << ' ' << failed.item_path << " (" << failed.error.value_or(failed.message) << ");";
        }
    }

    result.success = true;
    result.message = message.str();
    return result;
}

} // namespace envsync::sync
