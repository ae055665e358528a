#include "envsync/sync/conflict.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace envsync::sync {

std::string_view to_string(ConflictStrategy strategy) noexcept {
    switch (strategy) {
        case ConflictStrategy::SourceWins: return "source-wins";
        case ConflictStrategy::TargetWins: return "target-wins";
        case ConflictStrategy::Merge: return "merge";
        case ConflictStrategy::Manual: return "manual";
        case ConflictStrategy::Skip: return "skip";
    }
    return "unknown";
}

Result<ConflictStrategy> parse_conflict_strategy(std::string_view label) {
    std::string normalized(label);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });

    for (auto candidate : {ConflictStrategy::SourceWins, ConflictStrategy::TargetWins,
                           ConflictStrategy::Merge, ConflictStrategy::Manual, ConflictStrategy::Skip}) {
        if (normalized == to_string(candidate)) {
            return Ok(candidate);
        }
    }
    return Err<ConflictStrategy>(ErrorCode::InvalidArgument,
                                 "Unknown conflict strategy: " + std::string(label));
}

ContentResolution ConflictResolver::resolve_content() const noexcept {
    switch (strategy_) {
        case ConflictStrategy::SourceWins: return ContentResolution::ReplaceTarget;
        case ConflictStrategy::TargetWins: return ContentResolution::KeepTarget;
        case ConflictStrategy::Merge: return ContentResolution::MergeContent;
        case ConflictStrategy::Manual:
        case ConflictStrategy::Skip: return ContentResolution::Defer;
    }
    return ContentResolution::Defer;
}

bool ConflictResolver::allows_target_deletion() const noexcept {
    return strategy_ != ConflictStrategy::TargetWins;
}

bool ConflictResolver::allows_discarding_local_changes() const noexcept {
    return strategy_ == ConflictStrategy::SourceWins;
}

} // namespace envsync::sync
