#include "git_branch_resolver.hpp"
#include <print>
#include <sstream>
#include <utility>

namespace {

void rstripNewlines(std::string& str) {
    while (!str.empty() && (str.back() == '\n' || str.back() == '\r')) {
        str.pop_back();
    }
}

} // namespace

GitBranchResolver::GitBranchResolver(CommandRunner& runner, std::filesystem::path repository)
    : runner(runner), repository(std::move(repository)) {}

std::string GitBranchResolver::currentBranch() {
    auto output = runner.capture(Command{.argv = {"git", "-C", repository.string(), "rev-parse", "--abbrev-ref", "HEAD"}});
    if (!output) {
        std::println(stderr, "Warning: Failed to read current branch: {}", output.error());
        return {};
    }
    std::string branch = *output;
    rstripNewlines(branch);
    if (branch == "HEAD") {
        return {};
    }
    return branch;
}

std::vector<std::string> GitBranchResolver::branchesAt(const std::string& ref) {
    auto output = runner.capture(Command{.argv = {"git", "-C", repository.string(), "for-each-ref",
                                                  "--points-at", ref, "--format=%(refname:short)", "refs/heads/"}});
    if (!output) {
        std::println(stderr, "Warning: Failed to list branches at {}: {}", ref, output.error());
        return {};
    }

    std::vector<std::string> branches;
    std::istringstream lines(*output);
    std::string line;
    while (std::getline(lines, line)) {
        rstripNewlines(line);
        if (!line.empty()) {
            branches.push_back(line);
        }
    }
    return branches;
}
