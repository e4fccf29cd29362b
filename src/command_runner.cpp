#include "command_runner.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <format>
#include <print>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr int kPipeReadEnd = 0;
constexpr int kPipeWriteEnd = 1;
constexpr int kExecFailedStatus = 127;

// Runs in the forked child; never returns.
[[noreturn]] void execChild(const Command& command, int outputFd) {
    if (command.stdinFile) {
        int fd = open(command.stdinFile->c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1 || dup2(fd, STDIN_FILENO) != STDIN_FILENO) {
            std::println(stderr, "Couldn't open {} for reading: {}", command.stdinFile->string(), strerror(errno));
            _exit(kExecFailedStatus);
        }
    }
    if (outputFd != -1) {
        if (dup2(outputFd, STDOUT_FILENO) != STDOUT_FILENO) {
            std::println(stderr, "Couldn't attach output pipe: {}", strerror(errno));
            _exit(kExecFailedStatus);
        }
    } else if (command.stdoutFile) {
        int fd = open(command.stdoutFile->c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd == -1 || dup2(fd, STDOUT_FILENO) != STDOUT_FILENO) {
            std::println(stderr, "Couldn't open {} for writing: {}", command.stdoutFile->string(), strerror(errno));
            _exit(kExecFailedStatus);
        }
    }

    for (const auto& entry : command.environment) {
        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        setenv(entry.substr(0, eq).c_str(), entry.substr(eq + 1).c_str(), 1);
    }

    std::vector<char*> args;
    args.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    execvp(args[0], args.data());

    // Only reached if execvp failed.
    std::println(stderr, "Couldn't start {}: {}", command.argv.front(), strerror(errno));
    _exit(kExecFailedStatus);
}

} // namespace

std::string describe(const Command& command) {
    std::string out;
    for (const auto& entry : command.environment) {
        auto eq = entry.find('=');
        out += entry.substr(0, eq) + "=*** ";
    }
    for (size_t i = 0; i < command.argv.size(); ++i) {
        const std::string& arg = command.argv[i];
        if (i) {
            out += ' ';
        }
        if (arg.size() > 2 && arg.starts_with("-p")) {
            out += "-p***";
        } else if (arg.starts_with("--password=")) {
            out += "--password=***";
        } else if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += std::format("\"{}\"", arg);
        } else {
            out += arg;
        }
    }
    if (command.stdinFile) {
        out += " < " + command.stdinFile->string();
    }
    if (command.stdoutFile) {
        out += " > " + command.stdoutFile->string();
    }
    return out;
}

std::expected<int, std::string> SystemCommandRunner::spawnAndWait(const Command& command, std::string* output) {
    if (command.argv.empty()) {
        return std::unexpected("Empty command");
    }

    int pipeFds[2] = {-1, -1};
    if (output && pipe2(pipeFds, O_CLOEXEC) != 0) {
        return std::unexpected(std::format("Couldn't create output pipe: {}", strerror(errno)));
    }

    std::fflush(stdout);
    pid_t pid = fork();
    if (pid == -1) {
        std::string error = std::format("Couldn't fork for {}: {}", command.argv.front(), strerror(errno));
        if (output) {
            close(pipeFds[kPipeReadEnd]);
            close(pipeFds[kPipeWriteEnd]);
        }
        return std::unexpected(error);
    }
    if (pid == 0) {
        execChild(command, output ? pipeFds[kPipeWriteEnd] : -1);
    }

    if (output) {
        close(pipeFds[kPipeWriteEnd]);
        char buf[4096];
        while (true) {
            ssize_t n = read(pipeFds[kPipeReadEnd], buf, sizeof(buf));
            if (n == -1 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            output->append(buf, static_cast<size_t>(n));
        }
        close(pipeFds[kPipeReadEnd]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return std::unexpected(std::format("Couldn't wait for {}: {}", command.argv.front(), strerror(errno)));
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(std::format("{} was killed by signal {}", command.argv.front(), WTERMSIG(status)));
    }
    return std::unexpected(std::format("{} ended abnormally", command.argv.front()));
}

bool SystemCommandRunner::run(const Command& command) {
    auto result = spawnAndWait(command, nullptr);
    if (!result) {
        std::println(stderr, "Error: {}", result.error());
        return false;
    }
    if (*result != 0) {
        std::println(stderr, "Command exited with status {}: {}", *result, describe(command));
        return false;
    }
    return true;
}

std::expected<std::string, std::string> SystemCommandRunner::capture(const Command& command) {
    std::string output;
    auto result = spawnAndWait(command, &output);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (*result != 0) {
        return std::unexpected(std::format("{} exited with status {}", command.argv.front(), *result));
    }
    return output;
}
