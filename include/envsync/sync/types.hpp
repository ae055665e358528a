#pragma once

#include "envsync/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envsync::sync {

enum class ItemKind {
    File,
    Directory,
    StructuredConfig,
    Repository
};

/**
 * @brief Advisory label carried into every result
 *
 * Data always moves from an item's source path to its target path; callers
 * swap the roots to go the other way.
 */
enum class SyncDirection {
    SourceToTarget,
    TargetToSource,
    Bidirectional
};

std::string_view to_string(ItemKind kind) noexcept;
std::string_view to_string(SyncDirection direction) noexcept;

/// Accepts "source-to-target", "target-to-source", "bidirectional" ('_' also allowed)
Result<SyncDirection> parse_direction(std::string_view label);

/**
 * @brief Outcome of one sync item invocation
 *
 * Built once by the item and appended to the manager's log; never modified
 * afterwards.
 */
struct SyncResult {
    bool success = false;
    std::string item_path;                ///< Source path of the item
    ItemKind item_kind = ItemKind::File;
    SyncDirection direction = SyncDirection::Bidirectional;
    std::string message;
    std::optional<std::string> error;     ///< Underlying error text when success == false
    bool changes_made = false;
    std::uint32_t conflicts_resolved = 0;
    std::uintmax_t bytes_transferred = 0;
    /// Directory items only: one failed result per child that could not be synchronized
    std::vector<SyncResult> failed_children;
};

/**
 * @brief Counters over a result log
 */
struct SyncSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t changed = 0;
    std::uintmax_t bytes_transferred = 0;
};

} // namespace envsync::sync
