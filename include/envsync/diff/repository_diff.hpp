#pragma once

#include "envsync/vcs/git_client.hpp"

#include <filesystem>

namespace envsync::diff {

/**
 * @brief Compare the HEAD commits of two repositories
 *
 * Equal only when both HEADs resolve and name the same commit.
 */
bool repositories_equal(const vcs::GitClient& git,
                        const std::filesystem::path& lhs,
                        const std::filesystem::path& rhs);

} // namespace envsync::diff
