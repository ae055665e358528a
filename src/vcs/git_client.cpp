#include "envsync/vcs/git_client.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fs = std::filesystem;

namespace envsync::vcs {
namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string join(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

Result<void> as_void(const Result<CommandOutput>& result) {
    if (result.is_error()) {
        return result.error();
    }
    return Ok();
}

} // namespace

GitClient::GitClient(const CommandRunner& runner) : runner_(runner) {}

bool GitClient::is_repository(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path / ".git", ec);
}

Result<std::string> GitClient::rev_parse(const fs::path& repo, const std::string& ref) const {
    auto result = git_in(repo, {"rev-parse", ref});
    if (result.is_error()) {
        return result.error();
    }
    return Ok(trim(result.value().out));
}

Result<bool> GitClient::is_clean(const fs::path& repo) const {
    auto result = git_in(repo, {"status", "--porcelain"});
    if (result.is_error()) {
        return result.error();
    }
    return Ok(trim(result.value().out).empty());
}

Result<void> GitClient::clone(const fs::path& source, const fs::path& target) const {
    return as_void(git({"clone", source.string(), target.string()}));
}

Result<void> GitClient::add_remote(const fs::path& repo,
                                   const std::string& name,
                                   const std::string& url) const {
    auto result = git_in(repo, {"remote", "add", name, url});
    if (result.is_error() && result.message().find("already exists") != std::string::npos) {
        spdlog::debug("Remote '{}' already present in {}", name, repo.string());
        return Ok();
    }
    return as_void(result);
}

Result<void> GitClient::fetch(const fs::path& repo, const std::string& remote) const {
    return as_void(git_in(repo, {"fetch", remote}));
}

Result<std::string> GitClient::current_branch(const fs::path& repo) const {
    auto result = git_in(repo, {"rev-parse", "--abbrev-ref", "HEAD"});
    if (result.is_error()) {
        return result.error();
    }
    return Ok(trim(result.value().out));
}

Result<void> GitClient::reset_hard(const fs::path& repo, const std::string& ref) const {
    std::vector<std::string> args{"reset", "--hard"};
    if (!ref.empty()) {
        args.push_back(ref);
    }
    return as_void(git_in(repo, std::move(args)));
}

Result<void> GitClient::clean_untracked(const fs::path& repo) const {
    return as_void(git_in(repo, {"clean", "-fd"}));
}

Result<CommandOutput> GitClient::git(const std::vector<std::string>& args) const {
    spdlog::debug("git {}", join(args));
    auto result = runner_.run("git", args);
    if (result.is_error()) {
        return Err<CommandOutput>(ErrorCode::VersionControl, result.message());
    }
    if (!result.value().succeeded()) {
        return Err<CommandOutput>(ErrorCode::VersionControl,
                                  "git " + join(args) + " failed (exit " +
                                      std::to_string(result.value().exit_code) + "): " +
                                      trim(result.value().err));
    }
    return result;
}

Result<CommandOutput> GitClient::git_in(const fs::path& repo, std::vector<std::string> args) const {
    args.insert(args.begin(), {"-C", repo.string()});
    return git(args);
}

} // namespace envsync::vcs
