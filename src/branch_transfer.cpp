#include "branch_transfer.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace {

// Keeps the watcher paused for the lifetime of the guard.
class WatcherPause {
public:
    WatcherPause(WatcherControl& watcher, const HookConfig& config) : watcher(watcher), config(config) {
        watcher.pause();
    }

    ~WatcherPause() {
        try {
            watcher.resume();
        } catch (const std::exception& e) {
            config.logError(std::format("Failed to resume the watcher: {}", e.what()));
        }
    }

    WatcherPause(const WatcherPause&) = delete;
    WatcherPause& operator=(const WatcherPause&) = delete;

private:
    WatcherControl& watcher;
    const HookConfig& config;
};

std::string joinBranches(const std::vector<std::string>& branches) {
    std::string out;
    for (const auto& branch : branches) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::format("'{}'", branch);
    }
    return out;
}

} // namespace

std::string_view toString(TransferOutcome outcome) {
    switch (outcome) {
    case TransferOutcome::NoOpNotCheckout: return "NoOpNotCheckout";
    case TransferOutcome::NoOpSameBranch: return "NoOpSameBranch";
    case TransferOutcome::NoOpNoSourceBranches: return "NoOpNoSourceBranches";
    case TransferOutcome::NoOpInvalidBranch: return "NoOpInvalidBranch";
    case TransferOutcome::DumpFailed: return "DumpFailed";
    case TransferOutcome::RestoreSkippedNoDump: return "RestoreSkippedNoDump";
    case TransferOutcome::RestoreSucceeded: return "RestoreSucceeded";
    case TransferOutcome::RestoreFailed: return "RestoreFailed";
    }
    return "Unknown";
}

bool isFailure(TransferOutcome outcome) {
    return outcome == TransferOutcome::DumpFailed || outcome == TransferOutcome::RestoreFailed;
}

BranchTransfer::BranchTransfer(const HookConfig& config, DatabaseAdapter& adapter, WatcherControl& watcher)
    : config(config), adapter(adapter), watcher(watcher) {}

TransferOutcome BranchTransfer::execute(const TransferRequest& request) {
    if (!request.isCheckout) {
        return TransferOutcome::NoOpNotCheckout;
    }
    if (request.destinationBranch.empty()) {
        return TransferOutcome::NoOpInvalidBranch;
    }
    if (request.sourceBranches.empty()) {
        return TransferOutcome::NoOpNoSourceBranches;
    }
    if (std::ranges::any_of(request.sourceBranches, [](const std::string& b) { return b.empty(); })) {
        return TransferOutcome::NoOpInvalidBranch;
    }
    if (std::ranges::find(request.sourceBranches, request.destinationBranch) != request.sourceBranches.end()) {
        return TransferOutcome::NoOpSameBranch;
    }

    for (const auto& branch : request.sourceBranches) {
        if (!adapter.dump(branch)) {
            return TransferOutcome::DumpFailed;
        }
    }

    if (!adapter.dumpExists(request.destinationBranch)) {
        return TransferOutcome::RestoreSkippedNoDump;
    }
    return restore(request.destinationBranch);
}

TransferOutcome BranchTransfer::restore(const std::string& branch) {
    WatcherPause pause(watcher, config);

    if (!adapter.restore(branch)) {
        for (const auto& step : adapter.lastRestoreSteps()) {
            if (!step.succeeded) {
                config.logError(std::format("Restore step failed: {}", step.description));
            }
        }
        return TransferOutcome::RestoreFailed;
    }

    if (auto testDatabase = config.testDatabaseName()) {
        if (!adapter.terminateConnections(*testDatabase)) {
            config.logError(std::format("Failed to terminate connections to {}", *testDatabase));
        }
    }
    return TransferOutcome::RestoreSucceeded;
}

std::string BranchTransfer::message(TransferOutcome outcome, const TransferRequest& request) const {
    const std::string& db = config.database.database;
    const std::string& dest = request.destinationBranch;

    switch (outcome) {
    case TransferOutcome::NoOpNotCheckout:
        return "Not a branch checkout, database left untouched.";
    case TransferOutcome::NoOpSameBranch:
        return std::format("Already on branch '{}', database left untouched.", dest);
    case TransferOutcome::NoOpNoSourceBranches:
        return "No branch found for the previous HEAD, database left untouched.";
    case TransferOutcome::NoOpInvalidBranch:
        return "Detached HEAD or empty branch name, database left untouched.";
    case TransferOutcome::DumpFailed:
        return std::format("Failed to save the state of {} for {}; nothing was restored.",
                           db, joinBranches(request.sourceBranches));
    case TransferOutcome::RestoreSkippedNoDump:
        return std::format("No DB dump for {} on branch '{}' was found! Keeping the current database state; "
                           "it will be saved for '{}' on the next checkout.", db, dest, dest);
    case TransferOutcome::RestoreSucceeded:
        return std::format("Restored {} to the state saved on branch '{}'.", db, dest);
    case TransferOutcome::RestoreFailed:
        return std::format("Failed to restore {} from branch '{}'. The dump is kept at {}; "
                           "check {} for details.", db, dest, adapter.dumpPath(dest).string(),
                           config.errorLogFile.string());
    }
    return std::string(toString(outcome));
}
