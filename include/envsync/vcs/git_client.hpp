#pragma once

#include "envsync/core/result.hpp"
#include "envsync/vcs/command_runner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace envsync::vcs {

/**
 * @brief Thin wrapper over the git command line
 *
 * Every operation is one synchronous git invocation. Repository commands run
 * with `-C <repo>`. A non-zero exit becomes a VersionControl error whose
 * message carries git's stderr.
 */
class GitClient {
public:
    explicit GitClient(const CommandRunner& runner);

    /// True when path/.git is a directory
    [[nodiscard]] static bool is_repository(const std::filesystem::path& path);

    Result<std::string> rev_parse(const std::filesystem::path& repo,
                                  const std::string& ref = "HEAD") const;

    /// True when `status --porcelain` prints nothing
    Result<bool> is_clean(const std::filesystem::path& repo) const;

    Result<void> clone(const std::filesystem::path& source,
                       const std::filesystem::path& target) const;

    /// Succeeds when the remote already exists
    Result<void> add_remote(const std::filesystem::path& repo,
                            const std::string& name,
                            const std::string& url) const;

    Result<void> fetch(const std::filesystem::path& repo, const std::string& remote) const;

    Result<std::string> current_branch(const std::filesystem::path& repo) const;

    /// `reset --hard [ref]`; an empty ref resets to HEAD
    Result<void> reset_hard(const std::filesystem::path& repo, const std::string& ref = {}) const;

    /// `clean -fd`
    Result<void> clean_untracked(const std::filesystem::path& repo) const;

private:
    Result<CommandOutput> git(const std::vector<std::string>& args) const;
    Result<CommandOutput> git_in(const std::filesystem::path& repo, std::vector<std::string> args) const;

    const CommandRunner& runner_;
};

} // namespace envsync::vcs
