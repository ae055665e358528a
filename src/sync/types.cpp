#include "envsync/sync/types.hpp"

#include <algorithm>
#include <cctype>

namespace envsync::sync {
namespace {

std::string normalize_label(std::string_view label) {
    std::string normalized(label);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });
    return normalized;
}

} // namespace

std::string_view to_string(ItemKind kind) noexcept {
    switch (kind) {
        case ItemKind::File: return "file";
        case ItemKind::Directory: return "directory";
        case ItemKind::StructuredConfig: return "structured-config";
        case ItemKind::Repository: return "repository";
    }
    return "unknown";
}

std::string_view to_string(SyncDirection direction) noexcept {
    switch (direction) {
        case SyncDirection::SourceToTarget: return "source-to-target";
        case SyncDirection::TargetToSource: return "target-to-source";
        case SyncDirection::Bidirectional: return "bidirectional";
    }
    return "unknown";
}

Result<SyncDirection> parse_direction(std::string_view label) {
    const auto normalized = normalize_label(label);
    if (normalized == "source-to-target") {
        return Ok(SyncDirection::SourceToTarget);
    }
    if (normalized == "target-to-source") {
        return Ok(SyncDirection::TargetToSource);
    }
    if (normalized == "bidirectional") {
        return Ok(SyncDirection::Bidirectional);
    }
    return Err<SyncDirection>(ErrorCode::InvalidArgument,
                              "Unknown sync direction: " + std::string(label));
}

} // namespace envsync::sync
