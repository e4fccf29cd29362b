/**
 * @file hook_api.hpp
 * @brief High-level API for the BranchVault checkout hook.
 *
 * Wires configuration, the command runner, git, the database adapter and the watcher
 * coordinator together for the CLI sub-commands.
 */

#ifndef HOOK_API_HPP
#define HOOK_API_HPP

#include <string>
#include <vector>
#include <expected>
#include "branch_transfer.hpp"
#include "command_runner.hpp"

/**
 * @brief Arguments git passes to a post-checkout hook.
 */
struct PostCheckoutArgs {
    std::string previousRef; ///< HEAD before the checkout.
    std::string newRef;      ///< HEAD after the checkout.
    bool branchCheckout;     ///< True for branch checkouts ("1"), false for file checkouts ("0").
};

/**
 * @brief API for managing the hook.
 */
class HookAPI {
public:
    /**
     * @brief Runs the hook for one checkout.
     *
     * Loads the configuration, creates the dump folder, takes the dump folder lock, resolves
     * the branches, performs the transfer and logs its outcome.
     *
     * @param configFile Path to the JSON configuration file.
     * @param args Hook arguments.
     * @param runner Command transport.
     * @return std::expected<TransferOutcome, std::string> The outcome, or a configuration/lock error.
     */
    static std::expected<TransferOutcome, std::string> postCheckout(const std::string& configFile,
                                                                    const PostCheckoutArgs& args,
                                                                    CommandRunner& runner);

    /**
     * @brief Prepares a project for the hook.
     *
     * Writes a default configuration if none exists, creates the dump folder, and installs
     * the post-checkout hook script.
     *
     * @param configFile Path to the JSON configuration file.
     * @param runner Command transport used to locate the git hooks directory.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> init(const std::string& configFile, CommandRunner& runner);

    /**
     * @brief Parses the three hook arguments.
     *
     * @return std::expected<PostCheckoutArgs, std::string> Parsed arguments or a usage error.
     */
    static std::expected<PostCheckoutArgs, std::string> parseArgs(const std::vector<std::string>& args);
};

#endif // HOOK_API_HPP
