#include "envsync/vcs/command_runner.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <future>

namespace bp = boost::process;

namespace envsync::vcs {

Result<CommandOutput> ProcessRunner::run(const std::string& program,
                                         const std::vector<std::string>& args) const {
    const auto executable = bp::search_path(program);
    if (executable.empty()) {
        return Err<CommandOutput>(ErrorCode::NotFound, "Executable not found on PATH: " + program);
    }

    try {
        boost::asio::io_context io;
        std::future<std::string> out;
        std::future<std::string> err;

        bp::child child(executable,
                        bp::args(args),
                        bp::std_in.close(),
                        bp::std_out > out,
                        bp::std_err > err,
                        bp::env["GIT_TERMINAL_PROMPT"] = "0",
                        io);
        io.run();
        child.wait();

        CommandOutput output;
        output.exit_code = child.exit_code();
        output.out = out.get();
        output.err = err.get();
        return Ok(std::move(output));
    } catch (const bp::process_error& e) {
        spdlog::error("Failed to start {}: {}", program, e.what());
        return Err<CommandOutput>(ErrorCode::Io, "Failed to start " + program + ": " + e.what());
    }
}

} // namespace envsync::vcs
