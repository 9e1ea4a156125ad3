#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "core/context.hpp"

namespace branchsweep::io {

using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

struct ProcessResult {
    int code = -1;
    std::string commandLine;
    std::string out;
    std::string err;

    bool ok() const { return code == 0; }
};

std::string shellQuote(const std::string &value);

// Runs with the terminal's stdin/stdout/stderr.
ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const branchsweep::Context &ctx
);

// Runs with stdin on /dev/null and stdout/stderr collected into the result.
ProcessResult runCommandCapture(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const branchsweep::Context &ctx,
    const EnvOverrides &env = {}
);

} // namespace branchsweep::io
