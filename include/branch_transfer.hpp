/**
 * @file branch_transfer.hpp
 * @brief Orchestrates saving and restoring database state on a branch switch.
 *
 * One run dumps the database for every branch being left, then, if the branch being entered
 * has a dump, pauses the test watcher, restores that dump and resumes the watcher.
 */

#ifndef BRANCH_TRANSFER_HPP
#define BRANCH_TRANSFER_HPP

#include <string>
#include <vector>
#include <string_view>
#include "database_adapter.hpp"
#include "watcher_coordinator.hpp"
#include "hook_config.hpp"

/**
 * @brief Terminal state of one orchestration run.
 */
enum class TransferOutcome {
    NoOpNotCheckout,        ///< Hook fired for a file checkout, not a branch switch.
    NoOpSameBranch,         ///< Destination branch is one of the source branches.
    NoOpNoSourceBranches,   ///< No branch pointed at the previous HEAD.
    NoOpInvalidBranch,      ///< Destination or a source branch is empty (detached HEAD).
    DumpFailed,             ///< Saving a source branch failed; nothing was restored.
    RestoreSkippedNoDump,   ///< Destination branch was never saved; database left as is.
    RestoreSucceeded,       ///< Destination branch state restored.
    RestoreFailed           ///< Importing the destination dump failed.
};

/**
 * @brief Inputs supplied by the hook for one run.
 */
struct TransferRequest {
    std::vector<std::string> sourceBranches; ///< Branches pointing at the commit being left.
    std::string destinationBranch;           ///< Branch being checked out.
    bool isCheckout = true;                  ///< False when git reports a file checkout.
};

std::string_view toString(TransferOutcome outcome);

/**
 * @brief Returns true for outcomes worth a non-zero exit status.
 */
bool isFailure(TransferOutcome outcome);

/**
 * @brief Main branch switch orchestration class.
 */
class BranchTransfer {
public:
    /**
     * @brief Constructs an orchestrator.
     *
     * @param config Hook configuration (test database naming and logging).
     * @param adapter Database adapter; must outlive the orchestrator.
     * @param watcher Watcher control; must outlive the orchestrator.
     */
    BranchTransfer(const HookConfig& config, DatabaseAdapter& adapter, WatcherControl& watcher);

    /**
     * @brief Performs one branch switch transfer.
     *
     * Degenerate requests end in a NoOp* outcome without any adapter or watcher call. Source
     * branches are dumped in order and the first failure stops the run. The watcher is resumed
     * whenever it was paused, including when the restore fails.
     *
     * @param request Source and destination branches.
     * @return TransferOutcome The terminal state.
     */
    TransferOutcome execute(const TransferRequest& request);

    /**
     * @brief User-facing summary for an outcome of the given request.
     */
    std::string message(TransferOutcome outcome, const TransferRequest& request) const;

private:
    TransferOutcome restore(const std::string& branch);

    const HookConfig& config;
    DatabaseAdapter& adapter;
    WatcherControl& watcher;
};

#endif // BRANCH_TRANSFER_HPP
