#include "hook_api.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] init" << std::endl;
    std::cerr << "       " << program << " [--config <path>] post-checkout <previous-ref> <new-ref> <branch-flag>" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = ".branchvault.json";
    std::string command;
    std::vector<std::string> commandArgs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty() && arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (command.empty()) {
            command = arg;
        } else {
            commandArgs.push_back(arg);
        }
    }

    SystemCommandRunner runner;

    if (command == "init") {
        auto result = HookAPI::init(configFile, runner);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        return 0;
    }

    if (command == "post-checkout") {
        auto args = HookAPI::parseArgs(commandArgs);
        if (!args) {
            std::cerr << "Error: " << args.error() << std::endl;
            printUsage(argv[0]);
            return 2;
        }
        auto outcome = HookAPI::postCheckout(configFile, *args, runner);
        if (!outcome) {
            std::cerr << "Error: " << outcome.error() << std::endl;
            return 1;
        }
        return isFailure(*outcome) ? 1 : 0;
    }

    printUsage(argv[0]);
    return 2;
}
