#include "io/process.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace branchsweep::io {
namespace {

constexpr int kExecFailed = 127;

std::string buildDisplayCommand(const std::string &command, const std::vector<std::string> &args) {
    std::ostringstream cmd;
    cmd << shellQuote(command);
    for (const auto &arg : args) {
        cmd << ' ' << shellQuote(arg);
    }
    return cmd.str();
}

bool validateWorkingDirectory(const std::filesystem::path &cwd, const branchsweep::Context &ctx) {
    if (cwd.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(cwd, ec) || !std::filesystem::is_directory(cwd, ec)) {
        ctx.error("Working directory does not exist: ", cwd.string());
        return false;
    }
    return true;
}

std::vector<char *> makeArgv(std::vector<std::string> &storage) {
    std::vector<char *> argv;
    argv.reserve(storage.size() + 1);
    for (auto &item : storage) {
        argv.push_back(const_cast<char *>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

void closeFd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Reads both pipes until the child closes them.
bool drainPipes(int outFd, int errFd, ProcessResult &result, const branchsweep::Context &ctx) {
    std::array<pollfd, 2> fds{};
    fds[0].fd = outFd;
    fds[0].events = POLLIN;
    fds[1].fd = errFd;
    fds[1].events = POLLIN;

    std::array<char, 4096> buffer{};
    int remaining = 2;
    while (remaining > 0) {
        const int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ctx.error("Failed to poll process output: ", std::strerror(errno));
            return false;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            const ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                fds[i].fd = -1;
                --remaining;
                continue;
            }
            std::string &sink = i == 0 ? result.out : result.err;
            sink.append(buffer.data(), static_cast<std::size_t>(n));
        }
    }
    return true;
}

int waitForChild(pid_t pid, const branchsweep::Context &ctx) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) {
            continue;
        }
        ctx.error("Failed to wait for process: ", std::strerror(errno));
        return -1;
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        ctx.warn("Process terminated by signal: ", WTERMSIG(status));
        return 128 + WTERMSIG(status);
    }
    ctx.error("Process ended abnormally");
    return -1;
}

ProcessResult runCommandPosix(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const branchsweep::Context &ctx,
    bool capture,
    const EnvOverrides &env
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);

    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv = makeArgv(storage);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (capture) {
        if (pipe(outPipe) != 0 || pipe(errPipe) != 0) {
            ctx.error("Failed to create pipe: ", std::strerror(errno));
            closeFd(outPipe[0]);
            closeFd(outPipe[1]);
            closeFd(errPipe[0]);
            closeFd(errPipe[1]);
            return result;
        }
    }

    const pid_t pid = fork();
    if (pid < 0) {
        ctx.error("Failed to fork process: ", std::strerror(errno));
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(kExecFailed);
        }

        if (capture) {
            const int devNull = open("/dev/null", O_RDONLY);
            if (devNull >= 0) {
                dup2(devNull, STDIN_FILENO);
                close(devNull);
            }
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(errPipe[1], STDERR_FILENO);
            close(outPipe[0]);
            close(outPipe[1]);
            close(errPipe[0]);
            close(errPipe[1]);
        }

        for (const auto &[name, value] : env) {
            setenv(name.c_str(), value.c_str(), 1);
        }

        execvp(command.c_str(), argv.data());
        _exit(kExecFailed);
    }

    if (capture) {
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        const bool drained = drainPipes(outPipe[0], errPipe[0], result, ctx);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        const int code = waitForChild(pid, ctx);
        result.code = drained ? code : -1;
        return result;
    }

    result.code = waitForChild(pid, ctx);
    return result;
}

ProcessResult runCommandInternal(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const branchsweep::Context &ctx,
    bool capture,
    const EnvOverrides &env
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);

    if (!cwd.empty()) {
        ctx.debug("cwd: ", cwd.string());
    }
    ctx.debug(result.commandLine);

    if (!validateWorkingDirectory(cwd, ctx)) {
        result.code = -1;
        return result;
    }

    // Anything buffered must reach the terminal before the child writes to it.
    ctx.out().flush();
    ctx.err().flush();

    return runCommandPosix(command, args, cwd, ctx, capture, env);
}

} // namespace

std::string shellQuote(const std::string &value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const branchsweep::Context &ctx
) {
    return runCommandInternal(command, args, cwd, ctx, false, {});
}

ProcessResult runCommandCapture(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const branchsweep::Context &ctx,
    const EnvOverrides &env
) {
    return runCommandInternal(command, args, cwd, ctx, true, env);
}

} // namespace branchsweep::io
