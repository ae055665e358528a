#pragma once

#include "envsync/vcs/command_runner.hpp"

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace envsync::testing {

/**
 * @brief Records every invocation and answers from a list of scripted rules
 *
 * A rule matches when its fragment occurs in the space-joined argument list;
 * the first match wins. Unmatched commands succeed with empty output.
 */
class FakeCommandRunner : public vcs::CommandRunner {
public:
    void respond(std::string fragment, vcs::CommandOutput output) {
        std::lock_guard lock(mutex_);
        rules_.emplace_back(std::move(fragment), std::move(output));
    }

    void respond(std::string fragment, int exit_code, std::string out, std::string err = {}) {
        respond(std::move(fragment), vcs::CommandOutput{exit_code, std::move(out), std::move(err)});
    }

    Result<vcs::CommandOutput> run(const std::string& program,
                                   const std::vector<std::string>& args) const override {
        std::lock_guard lock(mutex_);
        const auto line = join(args);
        calls_.push_back(program + " " + line);
        for (const auto& [fragment, output] : rules_) {
            if (line.find(fragment) != std::string::npos) {
                return Ok(output);
            }
        }
        return Ok(vcs::CommandOutput{0, {}, {}});
    }

    std::vector<std::string> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    bool was_called_with(const std::string& fragment) const {
        std::lock_guard lock(mutex_);
        for (const auto& call : calls_) {
            if (call.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    static std::string join(const std::vector<std::string>& args) {
        std::string line;
        for (const auto& arg : args) {
            if (!line.empty()) {
                line += ' ';
            }
            line += arg;
        }
        return line;
    }

    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, vcs::CommandOutput>> rules_;
    mutable std::vector<std::string> calls_;
};

} // namespace envsync::testing
