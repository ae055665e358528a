#pragma once

#include "envsync/core/result.hpp"

#include <string>
#include <vector>

namespace envsync::vcs {

/**
 * @brief Captured outcome of one finished external command
 */
struct CommandOutput {
    int exit_code = -1;
    std::string out;
    std::string err;

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

/**
 * @brief Runs an external program synchronously
 *
 * run() returns an error only when the program could not be started at all;
 * a non-zero exit status is reported through CommandOutput::exit_code.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual Result<CommandOutput> run(const std::string& program,
                                      const std::vector<std::string>& args) const = 0;
};

/**
 * @brief CommandRunner backed by Boost.Process
 *
 * The program is looked up on PATH. stdin is closed, stdout and stderr are
 * collected through an asio io_context, and GIT_TERMINAL_PROMPT=0 is set so
 * git never waits for credentials.
 */
class ProcessRunner final : public CommandRunner {
public:
    Result<CommandOutput> run(const std::string& program,
                              const std::vector<std::string>& args) const override;
};

} // namespace envsync::vcs
