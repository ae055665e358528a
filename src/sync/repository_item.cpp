#include "envsync/sync/items.hpp"

#include "envsync/diff/repository_diff.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

namespace envsync::sync {
namespace fs = std::filesystem;

RepositoryItem::RepositoryItem(fs::path source, fs::path target,
                               const SyncConfiguration& config, const vcs::GitClient& git)
    : source_(std::move(source)), target_(std::move(target)), config_(config), git_(git) {}

bool RepositoryItem::needs_sync() const {
    if (config_.is_excluded(source_)) {
        return false;
    }
    return !diff::repositories_equal(git_, source_, target_);
}

SyncResult RepositoryItem::fail(SyncResult result, const std::string& message, const Error& error) const {
    spdlog::error("{} ({}): {}", message, target_.string(), error.message);
    result.message = message;
    result.error = error.message;
    return result;
}

SyncResult RepositoryItem::synchronize() const {
    auto result = make_result(kKind, source_, config_);

    if (config_.is_excluded(source_)) {
        result.success = true;
        result.message = "Repository is excluded";
        return result;
    }

    if (!vcs::GitClient::is_repository(source_)) {
        result.message = "Source is not a Git repository";
        result.error = "No .git directory in " + source_.string();
        return result;
    }

    std::error_code ec;
    if (!fs::exists(target_, ec)) {
        if (config_.dry_run()) {
            result.success = true;
            result.message = "Would clone Git repository (dry run)";
            return result;
        }
        if (auto cloned = git_.clone(source_, target_); cloned.is_error()) {
            return fail(std::move(result), "Failed to clone Git repository", cloned.error());
        }
        result.success = true;
        result.changes_made = true;
        result.message = "Git repository cloned";
        return result;
    }

    if (!vcs::GitClient::is_repository(target_)) {
        result.message = "Target exists but is not a Git repository";
        result.error = "No .git directory in " + target_.string();
        return result;
    }

    if (diff::repositories_equal(git_, source_, target_)) {
        result.success = true;
        result.message = "Git repository is already in sync";
        return result;
    }

    auto clean = git_.is_clean(target_);
    if (clean.is_error()) {
        return fail(std::move(result), "Failed to read target status", clean.error());
    }

    const bool dirty = !clean.value();
    if (dirty && !config_.resolver().allows_discarding_local_changes()) {
        result.message = "Target has uncommitted changes";
        result.error = "Uncommitted changes in " + target_.string();
        return result;
    }

    if (config_.dry_run()) {
        result.success = true;
        result.message = "Would synchronize Git repository (dry run)";
        return result;
    }

    if (dirty) {
        spdlog::warn("Discarding uncommitted changes in {}", target_.string());
        if (auto reset = git_.reset_hard(target_); reset.is_error()) {
            return fail(std::move(result), "Failed to discard local changes", reset.error());
        }
        if (auto cleaned = git_.clean_untracked(target_); cleaned.is_error()) {
            return fail(std::move(result), "Failed to remove untracked files", cleaned.error());
        }
    }

    const auto source_url = fs::absolute(source_, ec);
    if (auto remote = git_.add_remote(target_, kRemoteName, ec ? source_.string() : source_url.string());
        remote.is_error()) {
        return fail(std::move(result), "Failed to add source remote", remote.error());
    }
    if (auto fetched = git_.fetch(target_, kRemoteName); fetched.is_error()) {
        return fail(std::move(result), "Failed to fetch from source", fetched.error());
    }

    auto branch = git_.current_branch(target_);
    if (branch.is_error()) {
        return fail(std::move(result), "Failed to determine current branch", branch.error());
    }
    if (auto reset = git_.reset_hard(target_, std::string(kRemoteName) + "/" + branch.value()); reset.is_error()) {
        return fail(std::move(result), "Failed to reset to source", reset.error());
    }

    spdlog::debug("Reset {} to {}/{}", target_.string(), kRemoteName, branch.value());
    result.success = true;
    result.changes_made = true;
    result.message = "Git repository synchronized";
    return result;
}

} // namespace envsync::sync
