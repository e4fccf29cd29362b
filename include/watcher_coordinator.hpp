/**
 * @file watcher_coordinator.hpp
 * @brief Pauses and resumes a running file-watching test runner around a restore.
 *
 * The watcher's signal handling is stateful: one interrupt cancels the test run in progress,
 * a second one is needed to halt or restart the watch loop. The pause and resume sequences
 * below are therefore order and timing sensitive and must not be collapsed to single signals.
 */

#ifndef WATCHER_COORDINATOR_HPP
#define WATCHER_COORDINATOR_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <sys/types.h>
#include "command_runner.hpp"
#include "hook_config.hpp"

/**
 * @brief Process ids of the watcher and its output formatter.
 */
struct WatcherHandle {
    std::optional<pid_t> corePid;      ///< Long-running watcher process.
    std::optional<pid_t> formatterPid; ///< Short-lived formatter child; looked up on every use.
};

/**
 * @brief Interface for suspending the watcher while the database is swapped.
 */
class WatcherControl {
public:
    virtual ~WatcherControl() = default;
    virtual void pause() = 0;
    virtual void resume() = 0;
};

/**
 * @brief Signal-based watcher handshake.
 *
 * Finds the watcher once at construction; when none is running, pause() and resume() do
 * nothing. Matches belonging to this process or any of its ancestors are never taken for the
 * watcher. Signals are delivered with kill(1) through the CommandRunner.
 */
class WatcherCoordinator : public WatcherControl {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    /**
     * @brief Looks up the watcher process.
     *
     * @param runner Command transport; must outlive the coordinator.
     * @param config Process markers, signal names and settle delay.
     * @param sleeper Wait function; defaults to std::this_thread::sleep_for.
     */
    WatcherCoordinator(CommandRunner& runner, const WatcherConfig& config, Sleeper sleeper = {});

    /**
     * @brief Stops the watcher from reacting to changes.
     *
     * Sends pause-watch and interrupt to the watcher, interrupt to the formatter, waits,
     * interrupts the watcher once more and waits again.
     */
    void pause() override;

    /**
     * @brief Lets the watcher react to changes again.
     *
     * Sends interrupt to watcher and formatter, resume-watch to the watcher, then interrupt to
     * formatter and watcher again.
     */
    void resume() override;

    const WatcherHandle& handle() const { return watcher; }
    bool active() const { return watcher.corePid.has_value(); }

private:
    std::optional<pid_t> findProcess(const std::string& marker);
    void signal(const std::optional<pid_t>& pid, const std::string& name);

    CommandRunner& runner;
    WatcherConfig config;
    Sleeper sleeper;
    std::set<pid_t> lineage; ///< This process and its ancestors; excluded from discovery.
    WatcherHandle watcher;
};

#endif // WATCHER_COORDINATOR_HPP
