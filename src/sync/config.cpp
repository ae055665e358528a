#include "envsync/sync/config.hpp"

#include "envsync/core/errors.hpp"
#include "envsync/diff/json_diff.hpp"

#include <regex>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace envsync::sync {
namespace {

std::vector<std::string> reserved_names_for(const SyncOptions& options) {
    std::vector<std::string> names{kBackupDirectoryName};
    if (options.backup_directory && !options.backup_directory->filename().empty()) {
        names.push_back(options.backup_directory->filename().string());
    }
    return names;
}

diff::ExclusionFilter build_filter(const SyncOptions& options) {
    if (options.source_root.empty()) {
        throw ConfigurationError("source_root must not be empty");
    }
    if (options.target_root.empty()) {
        throw ConfigurationError("target_root must not be empty");
    }
    if (options.max_workers < 1) {
        throw ConfigurationError("max_workers must be at least 1, got " +
                                 std::to_string(options.max_workers));
    }

    try {
        return diff::ExclusionFilter(options.exclude_patterns, options.include_hidden,
                                     reserved_names_for(options));
    } catch (const std::regex_error& e) {
        throw ConfigurationError(std::string("Invalid exclude pattern: ") + e.what());
    }
}

} // namespace

SyncConfiguration::SyncConfiguration(SyncOptions options)
    : options_(std::move(options)), filter_(build_filter(options_)) {}

fs::path SyncConfiguration::backup_directory_for(const fs::path& path) const {
    if (options_.backup_directory) {
        return *options_.backup_directory;
    }
    return path.parent_path() / kBackupDirectoryName;
}

Result<SyncOptions> options_from_json(const json& document, SyncOptions base) {
    if (!document.is_object()) {
        return Err<SyncOptions>(ErrorCode::Parse, "Configuration must be a JSON object");
    }

    try {
        if (document.contains("source_root")) {
            base.source_root = document.at("source_root").get<std::string>();
        }
        if (document.contains("target_root")) {
            base.target_root = document.at("target_root").get<std::string>();
        }
        if (document.contains("direction")) {
            auto direction = parse_direction(document.at("direction").get<std::string>());
            if (direction.is_error()) {
                return direction.error();
            }
            base.direction = direction.value();
        }
        if (document.contains("conflict_strategy")) {
            auto strategy = parse_conflict_strategy(document.at("conflict_strategy").get<std::string>());
            if (strategy.is_error()) {
                return strategy.error();
            }
            base.conflict_strategy = strategy.value();
        }
        if (document.contains("exclude_patterns")) {
            base.exclude_patterns = document.at("exclude_patterns").get<std::vector<std::string>>();
        }
        base.max_workers = document.value("max_workers", base.max_workers);
        base.dry_run = document.value("dry_run", base.dry_run);
        base.verbose = document.value("verbose", base.verbose);
        base.include_hidden = document.value("include_hidden", base.include_hidden);
        base.backup_enabled = document.value("backup_enabled", base.backup_enabled);
        if (document.contains("backup_directory")) {
            const auto& value = document.at("backup_directory");
            if (value.is_null()) {
                base.backup_directory.reset();
            } else {
                base.backup_directory = fs::path(value.get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        return Err<SyncOptions>(ErrorCode::Parse, std::string("Invalid configuration value: ") + e.what());
    }

    return Ok(std::move(base));
}

Result<SyncOptions> load_options(const fs::path& path, SyncOptions base) {
    auto document = diff::load_json_document(path);
    if (document.is_error()) {
        return document.error();
    }
    return options_from_json(document.value(), std::move(base));
}

Result<SyncConfiguration> configuration_from_json(const json& document) {
    auto options = options_from_json(document);
    if (options.is_error()) {
        return options.error();
    }
    try {
        return SyncConfiguration(std::move(options.value()));
    } catch (const ConfigurationError& e) {
        return Err<SyncConfiguration>(ErrorCode::InvalidArgument, e.what());
    }
}

Result<SyncConfiguration> load_configuration(const fs::path& path) {
    auto document = diff::load_json_document(path);
    if (document.is_error()) {
        return document.error();
    }
    return configuration_from_json(document.value());
}

} // namespace envsync::sync
