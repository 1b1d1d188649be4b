#include "process/Runner.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

using namespace mg::process;
using namespace mg::logging;

namespace {
std::vector<char*> execArgs(const Command& cmd) {
    std::vector<char*> args;
    args.reserve(cmd.argv().size() + 1);
    for (const auto& a : cmd.argv()) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    return args;
}

int waitFor(const pid_t pid, const Command& cmd) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        throw std::runtime_error(fmt::format("waitpid failed for {}: {}", cmd.program(), std::strerror(errno)));
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}
}

int ForkExecRunner::run(const Command& cmd) {
    cmd.validate();
    LogRegistry::sync()->debug("[Runner] exec: {}", cmd.display());

    auto args = execArgs(cmd);

    const pid_t pid = fork();
    if (pid < 0) throw std::runtime_error(fmt::format("Failed to fork for {}: {}", cmd.program(), std::strerror(errno)));

    if (pid == 0) {
        // Child: the operator's Ctrl+C should reach the tool the usual way
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    return waitFor(pid, cmd);
}

int mg::process::pipeTo(const Command& cmd, const std::string& input) {
    cmd.validate();
    LogRegistry::sync()->debug("[Runner] exec with piped input: {}", cmd.display());

    auto args = execArgs(cmd);

    int fds[2];
    if (pipe(fds) != 0)
        throw std::runtime_error(fmt::format("Failed to create pipe for {}: {}", cmd.program(), std::strerror(errno)));

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw std::runtime_error(fmt::format("Failed to fork for {}: {}", cmd.program(), std::strerror(err)));
    }

    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        dup2(fds[0], STDIN_FILENO);
        close(fds[0]);
        close(fds[1]);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(fds[0]);

    // The reader may quit before taking everything; EPIPE just ends the write
    const auto previous = std::signal(SIGPIPE, SIG_IGN);
    std::size_t written = 0;
    while (written < input.size()) {
        const auto n = write(fds[1], input.data() + written, input.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno != EPIPE)
                LogRegistry::sync()->warn("[Runner] Writing to {} failed: {}", cmd.program(), std::strerror(errno));
            break;
        }
        written += static_cast<std::size_t>(n);
    }
    close(fds[1]);
    std::signal(SIGPIPE, previous);

    return waitFor(pid, cmd);
}
