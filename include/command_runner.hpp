/**
 * @file command_runner.hpp
 * @brief Process execution transport for BranchVault.
 *
 * Every external program the hook uses (database clients, git, kill, pgrep) goes through
 * the CommandRunner interface, so adapters and the orchestrator can be exercised with an
 * in-memory fake.
 */

#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <filesystem>

/**
 * @brief One external program invocation.
 */
struct Command {
    std::vector<std::string> argv;                  ///< Program followed by its arguments.
    std::vector<std::string> environment;           ///< Extra "NAME=value" entries added to the environment.
    std::optional<std::filesystem::path> stdinFile; ///< File connected to standard input.
    std::optional<std::filesystem::path> stdoutFile; ///< File (truncated) receiving standard output.
};

/**
 * @brief Renders a command for diagnostics, hiding passwords.
 */
std::string describe(const Command& command);

/**
 * @brief Interface for running external commands.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs a command to completion.
     *
     * @param command Command to run.
     * @return bool True if the command started and exited with status 0.
     */
    virtual bool run(const Command& command) = 0;

    /**
     * @brief Runs a command and collects its standard output.
     *
     * @param command Command to run; stdoutFile is ignored.
     * @return std::expected<std::string, std::string> Standard output or an error message.
     */
    virtual std::expected<std::string, std::string> capture(const Command& command) = 0;
};

/**
 * @brief Runs commands as child processes (fork/execvp), waiting for each to exit.
 */
class SystemCommandRunner : public CommandRunner {
public:
    bool run(const Command& command) override;
    std::expected<std::string, std::string> capture(const Command& command) override;

private:
    std::expected<int, std::string> spawnAndWait(const Command& command, std::string* output);
};

#endif // COMMAND_RUNNER_HPP
