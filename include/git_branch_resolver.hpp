/**
 * @file git_branch_resolver.hpp
 * @brief Turns the refs git passes to the post-checkout hook into branch names.
 */

#ifndef GIT_BRANCH_RESOLVER_HPP
#define GIT_BRANCH_RESOLVER_HPP

#include <string>
#include <vector>
#include <filesystem>
#include "command_runner.hpp"

/**
 * @brief Queries git for branch names.
 */
class GitBranchResolver {
public:
    /**
     * @param runner Command transport; must outlive the resolver.
     * @param repository Work tree git runs in (passed with "git -C").
     */
    GitBranchResolver(CommandRunner& runner, std::filesystem::path repository);

    /**
     * @brief Branch currently checked out.
     *
     * @return std::string The branch, or an empty string for a detached HEAD or on error.
     */
    std::string currentBranch();

    /**
     * @brief Local branches whose tip is the given commit.
     *
     * @param ref Commit id or ref, typically the previous HEAD given to the hook.
     * @return std::vector<std::string> Branch names in git's order; empty on error.
     */
    std::vector<std::string> branchesAt(const std::string& ref);

private:
    CommandRunner& runner;
    std::filesystem::path repository;
};

#endif // GIT_BRANCH_RESOLVER_HPP
