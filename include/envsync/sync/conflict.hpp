#pragma once

#include "envsync/core/result.hpp"

#include <string_view>

namespace envsync::sync {

enum class ConflictStrategy {
    SourceWins,
    TargetWins,
    Merge,
    Manual,
    Skip
};

std::string_view to_string(ConflictStrategy strategy) noexcept;

/// Accepts "source-wins", "target-wins", "merge", "manual", "skip" ('_' also allowed)
Result<ConflictStrategy> parse_conflict_strategy(std::string_view label);

/**
 * @brief What a sync item should do with content that differs on both sides
 */
enum class ContentResolution {
    ReplaceTarget,   ///< Source content overwrites the target
    KeepTarget,      ///< Target is left untouched, reported as success
    MergeContent,    ///< Structural merge of both sides
    Defer            ///< Left for a human; reported as skipped
};

/**
 * @brief The single policy applied by every item of one run
 */
class ConflictResolver {
public:
    explicit ConflictResolver(ConflictStrategy strategy) noexcept : strategy_(strategy) {}

    [[nodiscard]] ConflictStrategy strategy() const noexcept { return strategy_; }

    [[nodiscard]] ContentResolution resolve_content() const noexcept;

    /// Target-only files are deleted unless the target is authoritative
    [[nodiscard]] bool allows_target_deletion() const noexcept;

    /// Uncommitted changes in a target repository may only be discarded under SourceWins
    [[nodiscard]] bool allows_discarding_local_changes() const noexcept;

private:
    ConflictStrategy strategy_;
};

} // namespace envsync::sync
