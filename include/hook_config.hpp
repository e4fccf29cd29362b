/**
 * @file hook_config.hpp
 * @brief Configuration management for the BranchVault checkout hook.
 *
 * Defines the configuration structures and class holding the database, dump folder,
 * watcher and logging settings for one hook invocation. Settings are loaded once at the
 * boundary (CLI) and passed explicitly to every component; nothing below this layer reads
 * the environment or the current directory.
 *
 * @note Configuration is loaded from a JSON file (default ".branchvault.json" in the project root).
 */

#ifndef HOOK_CONFIG_HPP
#define HOOK_CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <filesystem>
#include <json/json.h>

/**
 * @brief Settings for the database whose state follows the current branch.
 */
struct DatabaseConfig {
    std::string adapter;                        ///< Engine name as configured ("postgres", "mysql").
    std::string database;                       ///< Name of the live database.
    std::optional<std::string> user;            ///< Optional database username.
    std::optional<std::string> password;        ///< Optional database password.
    std::optional<std::string> host;            ///< Optional database host.
    std::optional<int> port;                    ///< Optional database port.
    std::optional<std::string> testDatabase;    ///< Explicit name of the sibling test database.
    std::vector<std::string> commandPrefix;     ///< Prepended to every database command (e.g. docker exec).
};

/**
 * @brief Settings for the file-watching test runner paused around a restore.
 */
struct WatcherConfig {
    std::string processMarker = "guard";        ///< Matched against full command lines to find the watcher.
    std::string formatterMarker = "rspec";      ///< Matched to find the output formatter sub-process.
    std::string pauseSignal = "USR1";           ///< Tells the watcher to stop reacting to file changes.
    std::string resumeSignal = "USR2";          ///< Tells the watcher to react to file changes again.
    std::string interruptSignal = "INT";        ///< Cancels the current run / halts the watch loop.
    std::chrono::seconds settleDelay{1};        ///< Wait after interrupts while pausing.
};

/**
 * @brief Configuration class for the checkout hook.
 *
 * Loads and manages settings from a JSON configuration file, providing defaults and validation.
 */
class HookConfig {
public:
    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * Relative paths in the file are resolved against the directory containing it.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable, invalid, or lacks a database name.
     */
    explicit HookConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration instance from an already parsed JSON document.
     *
     * @param configJson Parsed configuration.
     * @param projectRoot Directory relative paths are resolved against.
     * @throws std::runtime_error If the database name is missing or a value has the wrong type.
     */
    HookConfig(const Json::Value& configJson, const std::filesystem::path& projectRoot);

    /**
     * @brief Logs a message to the log file and standard output.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to the error log file and standard error.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Name of the sibling test database.
     *
     * Uses the explicit test database when configured; otherwise substitutes the environment
     * token in the database name ("app_development" becomes "app_test").
     *
     * @return std::optional<std::string> The test database, or std::nullopt if none can be derived.
     */
    std::optional<std::string> testDatabaseName() const;

    /**
     * @brief Returns the default configuration written by "branchvault init".
     */
    static Json::Value defaults();

    std::filesystem::path projectRoot;          ///< Directory containing the configuration file.
    std::filesystem::path dumpFolder;           ///< Directory holding one dump per database and branch.
    std::filesystem::path logFile;              ///< Path to the log file.
    std::filesystem::path errorLogFile;         ///< Path to the error log file.
    std::filesystem::path lockFile;             ///< Advisory lock taken for a whole hook run.
    DatabaseConfig database;                    ///< Database settings.
    WatcherConfig watcher;                      ///< Watcher process settings.
    std::string environmentToken;               ///< Token naming the development environment.
    std::string testEnvironmentToken;           ///< Token replacing it for the test database.

private:
    void load(const Json::Value& configJson);
};

#endif // HOOK_CONFIG_HPP
