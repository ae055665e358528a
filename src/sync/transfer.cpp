#include "envsync/sync/transfer.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace envsync::sync {
namespace fs = std::filesystem;

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return Err<void>(ErrorCode::Io, "Failed to create directory " + parent.string() + ": " + ec.message());
    }
    return Ok();
}

Result<std::uintmax_t> copy_file_with_metadata(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    const auto size = fs::file_size(source, ec);
    if (ec) {
        return Err<std::uintmax_t>(ErrorCode::Io, "Cannot stat " + source.string() + ": " + ec.message());
    }

    if (auto res = ensure_parent_exists(target); res.is_error()) {
        return res.error();
    }

    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Err<std::uintmax_t>(ErrorCode::Io,
                                   "Failed to copy " + source.string() + " to " + target.string() + ": " + ec.message());
    }

    const auto permissions = fs::status(source, ec).permissions();
    if (!ec) {
        fs::permissions(target, permissions, fs::perm_options::replace, ec);
    }
    if (ec) {
        spdlog::warn("Could not copy permissions to {}: {}", target.string(), ec.message());
        ec.clear();
    }

    const auto modified = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(target, modified, ec);
    }
    if (ec) {
        return Err<std::uintmax_t>(ErrorCode::Io,
                                   "Failed to preserve modification time on " + target.string() + ": " + ec.message());
    }

    return Ok(size);
}

std::string backup_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d%H%M%S");
    return oss.str();
}

Result<std::optional<fs::path>> create_backup(const fs::path& path, const SyncConfiguration& config) {
    using BackupResult = Result<std::optional<fs::path>>;

    std::error_code ec;
    if (!config.backup_enabled() || !fs::exists(path, ec)) {
        return BackupResult(std::optional<fs::path>{});
    }

    const fs::path directory = config.backup_directory_for(path);
    fs::create_directories(directory, ec);
    if (ec && !fs::is_directory(directory)) {
        return Err<std::optional<fs::path>>(ErrorCode::Io,
                                            "Failed to create backup directory " + directory.string() + ": " + ec.message());
    }

    const fs::path backup = directory / (path.filename().string() + "." + backup_timestamp() + ".bak");
    if (fs::is_directory(path)) {
        fs::copy(path, backup, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    } else {
        fs::copy_file(path, backup, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        return Err<std::optional<fs::path>>(ErrorCode::Io,
                                            "Failed to back up " + path.string() + ": " + ec.message());
    }

    spdlog::debug("Backed up {} to {}", path.string(), backup.string());
    return BackupResult(std::optional<fs::path>(backup));
}

Result<void> remove_with_backup(const fs::path& path, const SyncConfiguration& config) {
    if (auto backup = create_backup(path, config); backup.is_error()) {
        return backup.error();
    }

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "Failed to remove " + path.string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> write_text_file(const fs::path& path, const std::string& content) {
    if (auto res = ensure_parent_exists(path); res.is_error()) {
        return res;
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorCode::Io, "Failed to open " + path.string() + " for writing");
    }
    output << content;
    output.flush();
    if (!output) {
        return Err<void>(ErrorCode::Io, "Failed to write " + path.string());
    }
    return Ok();
}

} // namespace envsync::sync
