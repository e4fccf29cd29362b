#include "hook_api.hpp"
#include "dump_folder_lock.hpp"
#include "git_branch_resolver.hpp"
#include "hook_config.hpp"
#include "watcher_coordinator.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* kHookMarker = "branchvault";
constexpr const char* kHookScript =
    "#!/bin/sh\n"
    "# Installed by branchvault: saves and restores the database per branch.\n"
    "exec branchvault post-checkout \"$@\"\n";

// Looks the watcher up only when a restore first pauses it, so runs that end before the
// restore never query the process table.
class DeferredWatcher : public WatcherControl {
public:
    DeferredWatcher(CommandRunner& runner, const WatcherConfig& config) : runner(runner), config(config) {}

    void pause() override { coordinator().pause(); }
    void resume() override { coordinator().resume(); }

private:
    WatcherCoordinator& coordinator() {
        if (!instance) {
            instance.emplace(runner, config);
        }
        return *instance;
    }

    CommandRunner& runner;
    const WatcherConfig& config;
    std::optional<WatcherCoordinator> instance;
};

std::expected<void, std::string> installHook(const fs::path& projectRoot, CommandRunner& runner) {
    auto output = runner.capture(Command{.argv = {"git", "-C", projectRoot.string(), "rev-parse", "--git-path", "hooks"}});
    if (!output) {
        return std::unexpected(std::format("Not a git repository ({}): {}", projectRoot.string(), output.error()));
    }
    std::string hooksDir = *output;
    while (!hooksDir.empty() && (hooksDir.back() == '\n' || hooksDir.back() == '\r')) {
        hooksDir.pop_back();
    }
    fs::path hooks = fs::path(hooksDir).is_absolute() ? fs::path(hooksDir) : projectRoot / hooksDir;
    fs::path hookFile = hooks / "post-checkout";

    if (fs::exists(hookFile)) {
        std::ifstream existing(hookFile);
        std::string content((std::istreambuf_iterator<char>(existing)), std::istreambuf_iterator<char>());
        if (content.find(kHookMarker) == std::string::npos) {
            return std::unexpected(std::format("Refusing to overwrite existing hook: {}", hookFile.string()));
        }
    }

    std::error_code ec;
    fs::create_directories(hooks, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create {}: {}", hooks.string(), ec.message()));
    }
    std::ofstream out(hookFile, std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(std::format("Failed to open hook for writing: {}", hookFile.string()));
    }
    out << kHookScript;
    out.close();
    fs::permissions(hookFile, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                  fs::perms::others_read | fs::perms::others_exec, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to make hook executable: {}", ec.message()));
    }
    std::println("Installed hook: {}", hookFile.string());
    return {};
}

} // namespace

std::expected<PostCheckoutArgs, std::string> HookAPI::parseArgs(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return std::unexpected("post-checkout expects <previous-ref> <new-ref> <branch-flag>");
    }
    if (args[2] != "0" && args[2] != "1") {
        return std::unexpected(std::format("Invalid branch flag: '{}' (expected 0 or 1)", args[2]));
    }
    return PostCheckoutArgs{args[0], args[1], args[2] == "1"};
}

std::expected<TransferOutcome, std::string> HookAPI::postCheckout(const std::string& configFile,
                                                                  const PostCheckoutArgs& args,
                                                                  CommandRunner& runner) {
    std::unique_ptr<HookConfig> config;
    try {
        config = std::make_unique<HookConfig>(configFile);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to load config: {}", e.what()));
    }

    std::error_code ec;
    fs::create_directories(config->dumpFolder, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create dump folder {}: {}", config->dumpFolder.string(), ec.message()));
    }

    std::unique_ptr<DatabaseAdapter> adapter;
    try {
        adapter = DatabaseAdapter::build(config->database, config->dumpFolder, runner);
    } catch (const UnsupportedAdapterError& e) {
        config->logError(e.what());
        return std::unexpected(e.what());
    }

    auto lock = DumpFolderLock::acquire(config->lockFile);
    if (!lock) {
        config->logError(lock.error());
        return std::unexpected(lock.error());
    }

    TransferRequest request;
    request.isCheckout = args.branchCheckout;
    if (request.isCheckout) {
        GitBranchResolver git(runner, config->projectRoot);
        request.sourceBranches = git.branchesAt(args.previousRef);
        request.destinationBranch = git.currentBranch();
    }

    DeferredWatcher watcher(runner, config->watcher);
    BranchTransfer transfer(*config, *adapter, watcher);
    TransferOutcome outcome = transfer.execute(request);

    std::string message = transfer.message(outcome, request);
    if (isFailure(outcome)) {
        config->logError(message);
    } else {
        config->logMessage(message);
    }
    return outcome;
}

std::expected<void, std::string> HookAPI::init(const std::string& configFile, CommandRunner& runner) {
    try {
        if (!fs::exists(configFile)) {
            std::ofstream outFile(configFile);
            if (!outFile.is_open()) {
                return std::unexpected("Failed to open config file for writing: " + configFile);
            }
            Json::StreamWriterBuilder builder;
            builder["indentation"] = "  ";
            std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
            writer->write(HookConfig::defaults(), &outFile);
            outFile << '\n';
            outFile.close();
            std::println("Wrote default configuration: {}", configFile);
        }

        HookConfig config(configFile);
        fs::create_directories(config.dumpFolder);
        std::println("Dump folder: {}", config.dumpFolder.string());

        return installHook(config.projectRoot, runner);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to initialize: {}", e.what()));
    }
}
