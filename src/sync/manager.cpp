#include "envsync/sync/manager.hpp"

#include "envsync/sync/transfer.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace envsync::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string iso_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

ItemKind classify(const fs::path& path) {
    std::error_code ec;
    if (vcs::GitClient::is_repository(path)) {
        return ItemKind::Repository;
    }
    if (fs::is_directory(path, ec)) {
        return ItemKind::Directory;
    }
    if (is_structured_config(path)) {
        return ItemKind::StructuredConfig;
    }
    return ItemKind::File;
}

SyncManager::SyncManager(SyncConfiguration config)
    : config_(std::move(config)),
      owned_runner_(std::make_unique<vcs::ProcessRunner>()),
      runner_(*owned_runner_),
      git_(runner_) {}

SyncManager::SyncManager(SyncConfiguration config, const vcs::CommandRunner& runner)
    : config_(std::move(config)), runner_(runner), git_(runner_) {}

SyncItem SyncManager::make_item(const fs::path& source, const fs::path& target) const {
    switch (classify(source)) {
        case ItemKind::Repository:
            return RepositoryItem(source, target, config_, git_);
        case ItemKind::Directory:
            return DirectoryItem(source, target, config_);
        case ItemKind::StructuredConfig:
            return StructuredConfigItem(source, target, config_);
        case ItemKind::File:
            break;
    }
    return FileItem(source, target, config_);
}

SyncResult SyncManager::sync_path(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        auto result = make_result(ItemKind::Directory, source, config_);
        result.success = true;
        result.message = "Source does not exist";
        spdlog::warn("Source does not exist: {}", source.string());
        results_.push_back(result);
        return result;
    }

    const auto item = make_item(source, target);
    spdlog::debug("Synchronizing {} {} -> {}", to_string(kind_of(item)), source.string(), target.string());

    auto result = synchronize(item);
    if (result.success) {
        spdlog::debug("{}: {}", source.string(), result.message);
    } else {
        spdlog::error("{}: {} ({})", source.string(), result.message, result.error.value_or("no details"));
    }

    // Failed children get their own log entries so summaries count them
    auto logged = result;
    auto children = std::move(logged.failed_children);
    logged.failed_children.clear();
    results_.push_back(std::move(logged));
    for (auto& child : children) {
        spdlog::error("{}: {} ({})", child.item_path, child.message, child.error.value_or("no details"));
        results_.push_back(std::move(child));
    }
    return result;
}

SyncResult SyncManager::run() {
    spdlog::info("Synchronizing {} -> {} (strategy: {}, direction: {}{})",
                 config_.source_root().string(), config_.target_root().string(),
                 to_string(config_.conflict_strategy()), to_string(config_.direction()),
                 config_.dry_run() ? ", dry run" : "");
    return sync_path(config_.source_root(), config_.target_root());
}

SyncSummary SyncManager::summary() const {
    return summarize(results_);
}

SyncSummary summarize(const std::vector<SyncResult>& results) {
    SyncSummary summary;
    summary.total = results.size();
    for (const auto& result : results) {
        if (result.success) {
            ++summary.succeeded;
        } else {
            ++summary.failed;
        }
        if (result.changes_made) {
            ++summary.changed;
        }
        summary.bytes_transferred += result.bytes_transferred;
    }
    return summary;
}

json result_to_json(const SyncResult& result) {
    json j;
    j["success"] = result.success;
    j["item_path"] = result.item_path;
    j["item_kind"] = std::string(to_string(result.item_kind));
    j["direction"] = std::string(to_string(result.direction));
    j["message"] = result.message;
    j["error"] = result.error ? json(*result.error) : json(nullptr);
    j["changes_made"] = result.changes_made;
    j["conflicts_resolved"] = result.conflicts_resolved;
    j["bytes_transferred"] = result.bytes_transferred;
    return j;
}

json results_to_json(const std::vector<SyncResult>& results) {
    json items = json::array();
    for (const auto& result : results) {
        items.push_back(result_to_json(result));
    }

    const auto summary = summarize(results);
    json report;
    report["timestamp"] = iso_timestamp();
    report["results"] = std::move(items);
    report["summary"] = {
        {"total", summary.total},
        {"succeeded", summary.succeeded},
        {"failed", summary.failed},
        {"changed", summary.changed},
        {"bytes_transferred", summary.bytes_transferred},
    };
    return report;
}

Result<void> write_status_report(const fs::path& path, const std::vector<SyncResult>& results) {
    return write_text_file(path, results_to_json(results).dump(2) + "\n");
}

SyncOptions environment_defaults(fs::path source_root, fs::path target_root) {
    SyncOptions options;
    options.source_root = std::move(source_root);
    options.target_root = std::move(target_root);
    options.conflict_strategy = ConflictStrategy::Merge;
    return options;
}

std::vector<SyncResult> synchronize_environments(SyncOptions options) {
    SyncManager manager{SyncConfiguration(std::move(options))};
    manager.run();

    const auto summary = manager.summary();
    spdlog::info("Synchronization finished: {} items, {} succeeded, {} failed, {} changed",
                 summary.total, summary.succeeded, summary.failed, summary.changed);
    return manager.results();
}

} // namespace envsync::sync
