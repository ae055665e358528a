#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace envsync::diff {

/**
 * @brief Patterns skipped when the caller does not provide its own list
 *
 * Covers VCS metadata, byte-compiled caches, virtual environments, editor
 * metadata, OS metadata files and test/coverage caches.
 */
const std::vector<std::string>& default_exclude_patterns();

/**
 * @brief Decides whether a path takes part in synchronization at all
 *
 * A path is excluded when any pattern matches somewhere in its string form,
 * when hidden entries are not included and its leaf name starts with '.', or
 * when its leaf name is one of the reserved names (backup directories).
 */
class ExclusionFilter {
public:
    /**
     * @throws std::regex_error if a pattern does not compile
     */
    ExclusionFilter(const std::vector<std::string>& patterns,
                    bool include_hidden,
                    std::vector<std::string> reserved_names = {});

    [[nodiscard]] bool is_excluded(const std::filesystem::path& path) const;

    [[nodiscard]] bool include_hidden() const noexcept { return include_hidden_; }
    [[nodiscard]] std::size_t pattern_count() const noexcept { return patterns_.size(); }

private:
    std::vector<std::regex> patterns_;
    bool include_hidden_ = false;
    std::vector<std::string> reserved_names_;
};

} // namespace envsync::diff
