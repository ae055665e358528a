#include "envsync/diff/repository_diff.hpp"

#include <spdlog/spdlog.h>

namespace envsync::diff {

bool repositories_equal(const vcs::GitClient& git,
                        const std::filesystem::path& lhs,
                        const std::filesystem::path& rhs) {
    const auto lhs_ref = git.rev_parse(lhs);
    const auto rhs_ref = git.rev_parse(rhs);
    if (lhs_ref.is_error() || rhs_ref.is_error()) {
        spdlog::debug("HEAD unresolved for {} or {}", lhs.string(), rhs.string());
        return false;
    }
    const auto& lhs_sha = lhs_ref.value();
    return !lhs_sha.empty() && lhs_sha == rhs_ref.value();
}

} // namespace envsync::diff
