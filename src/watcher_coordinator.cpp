#include "watcher_coordinator.hpp"
#include <charconv>
#include <format>
#include <fstream>
#include <print>
#include <sstream>
#include <thread>
#include <utility>
#include <unistd.h>

namespace {

// Parent pid from /proc/<pid>/stat. The command name in field 2 may itself contain spaces and
// parentheses, so parsing starts after its last ')'.
std::optional<pid_t> parentOf(pid_t pid) {
    std::ifstream stat(std::format("/proc/{}/stat", pid));
    std::string content;
    if (!std::getline(stat, content)) {
        return std::nullopt;
    }
    auto close = content.rfind(')');
    if (close == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream fields(content.substr(close + 1));
    char state = 0;
    pid_t parent = 0;
    if (!(fields >> state >> parent)) {
        return std::nullopt;
    }
    return parent;
}

// This process and every process that launched it. Their command lines often carry the branch
// name and may match a marker.
std::set<pid_t> selfAndAncestors() {
    std::set<pid_t> lineage{getpid()};
    std::optional<pid_t> pid = getppid();
    while (pid && *pid > 1 && lineage.insert(*pid).second) {
        pid = parentOf(*pid);
    }
    return lineage;
}

} // namespace

WatcherCoordinator::WatcherCoordinator(CommandRunner& runner, const WatcherConfig& config, Sleeper sleeper)
    : runner(runner), config(config), sleeper(std::move(sleeper)) {
    if (!this->sleeper) {
        this->sleeper = [](std::chrono::seconds delay) { std::this_thread::sleep_for(delay); };
    }
    lineage = selfAndAncestors();
    watcher.corePid = findProcess(config.processMarker);
}

std::optional<pid_t> WatcherCoordinator::findProcess(const std::string& marker) {
    if (marker.empty()) {
        return std::nullopt;
    }
    // pgrep exits with 1 when nothing matches; either way there is no process to signal.
    auto output = runner.capture(Command{.argv = {"pgrep", "-f", marker}});
    if (!output) {
        return std::nullopt;
    }

    std::istringstream lines(*output);
    std::string line;
    while (std::getline(lines, line)) {
        pid_t pid = 0;
        auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), pid);
        if (ec != std::errc() || pid <= 1 || lineage.contains(pid)) {
            continue;
        }
        return pid;
    }
    return std::nullopt;
}

void WatcherCoordinator::signal(const std::optional<pid_t>& pid, const std::string& name) {
    if (!pid) {
        return;
    }
    if (!runner.run(Command{.argv = {"kill", std::format("-{}", name), std::to_string(*pid)}})) {
        std::println(stderr, "Warning: Failed to send SIG{} to process {}", name, *pid);
    }
}

void WatcherCoordinator::pause() {
    if (!active()) {
        return;
    }
    watcher.formatterPid = findProcess(config.formatterMarker);

    signal(watcher.corePid, config.pauseSignal);
    signal(watcher.corePid, config.interruptSignal);
    signal(watcher.formatterPid, config.interruptSignal);
    sleeper(config.settleDelay);
    signal(watcher.corePid, config.interruptSignal);
    sleeper(config.settleDelay);
}

void WatcherCoordinator::resume() {
    if (!active()) {
        return;
    }
    watcher.formatterPid = findProcess(config.formatterMarker);

    signal(watcher.corePid, config.interruptSignal);
    signal(watcher.formatterPid, config.interruptSignal);
    signal(watcher.corePid, config.resumeSignal);
    signal(watcher.formatterPid, config.interruptSignal);
    signal(watcher.corePid, config.interruptSignal);
}
