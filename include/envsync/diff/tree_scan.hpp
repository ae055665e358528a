#pragma once

#include "envsync/core/result.hpp"
#include "envsync/diff/exclusion.hpp"

#include <filesystem>
#include <set>

namespace envsync::diff {

/**
 * @brief Recursively list the regular files under root that survive the filter
 *
 * Paths are returned relative to root. Excluded directories are pruned, so
 * nothing below them is visited. A missing root yields an empty set.
 */
Result<std::set<std::filesystem::path>> list_files(const std::filesystem::path& root,
                                                   const ExclusionFilter& filter);

} // namespace envsync::diff
