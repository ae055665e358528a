#pragma once

#include "envsync/core/result.hpp"
#include "envsync/sync/config.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace envsync::sync {

/// Create every missing directory above path
Result<void> ensure_parent_exists(const std::filesystem::path& path);

/**
 * @brief Copy a regular file, then carry over permissions and modification time
 *
 * Keeping the modification time lets the next equality check take the
 * metadata fast path.
 *
 * @return Number of bytes copied (the source size)
 */
Result<std::uintmax_t> copy_file_with_metadata(const std::filesystem::path& source,
                                               const std::filesystem::path& target);

/// Local time as YYYYMMDDHHMMSS
std::string backup_timestamp();

/**
 * @brief Copy path to <backup dir>/<name>.<YYYYMMDDHHMMSS>.bak
 *
 * @return The backup path, or nullopt when backups are disabled or path does not exist
 */
Result<std::optional<std::filesystem::path>> create_backup(const std::filesystem::path& path,
                                                           const SyncConfiguration& config);

/// Back up (when enabled) and delete a single target file
Result<void> remove_with_backup(const std::filesystem::path& path, const SyncConfiguration& config);

/// Write text to path, replacing any previous content
Result<void> write_text_file(const std::filesystem::path& path, const std::string& content);

} // namespace envsync::sync
