/**
 * @file database_adapter.hpp
 * @brief Defines database adapters that save and restore per-branch database state.
 *
 * Provides the adapter interface and its PostgreSQL and MySQL implementations. Each adapter
 * turns per-engine command templates into concrete client invocations (pg_dump, pg_restore,
 * mysqldump, mysql, ...) and runs them through a CommandRunner.
 *
 * @note Requires the engine's client tools in the PATH of the host, or of the container named
 * by the configured command prefix.
 */

#ifndef DATABASE_ADAPTER_HPP
#define DATABASE_ADAPTER_HPP

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include "command_runner.hpp"
#include "dump_file_namer.hpp"
#include "hook_config.hpp"

/**
 * @brief Thrown when the configured database engine has no adapter.
 */
class UnsupportedAdapterError : public std::runtime_error {
public:
    explicit UnsupportedAdapterError(const std::string& adapterKind);

    const std::string& adapterKind() const { return kind; }

private:
    std::string kind;
};

/**
 * @brief Outcome of a single step of a restore sequence.
 */
struct RestoreStep {
    std::string description; ///< What the step did ("drop database", ...).
    bool succeeded;          ///< Whether its command exited successfully.
};

/**
 * @brief Argument template for one client invocation.
 *
 * Elements are copied verbatim except for the placeholders:
 * - "{connection}" expands to the engine's credential/host flags (zero or more arguments);
 * - "{database}" inside an element is replaced by the database name;
 * - "{database_ident}" by the name quoted as an SQL identifier;
 * - "{database_literal}" by the name quoted as an SQL string literal.
 */
using CommandTemplate = std::vector<std::string>;

/**
 * @brief Abstract base class for database adapters.
 *
 * Defines the dump/restore contract shared by all engines. Failures of the underlying
 * commands are reported as false, never thrown.
 */
class DatabaseAdapter {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~DatabaseAdapter() = default;

    /**
     * @brief Creates the adapter for the configured engine.
     *
     * @param config Database configuration.
     * @param dumpFolder Folder holding the dump files.
     * @param runner Command transport; must outlive the adapter.
     * @return std::unique_ptr<DatabaseAdapter> The adapter.
     * @throws UnsupportedAdapterError If the engine is neither PostgreSQL nor MySQL.
     */
    static std::unique_ptr<DatabaseAdapter> build(const DatabaseConfig& config,
                                                  const std::filesystem::path& dumpFolder,
                                                  CommandRunner& runner);

    /**
     * @brief Saves the whole database to the dump file of the given branch.
     *
     * Overwrites any previous dump of the branch. A failed dump leaves no file behind.
     *
     * @param branch Branch the current database state belongs to.
     * @return bool True if the export command succeeded.
     */
    virtual bool dump(const std::string& branch) = 0;

    /**
     * @brief Replaces the live database with the dump of the given branch.
     *
     * @param branch Branch whose dump is imported.
     * @return bool True if the final import succeeded; see lastRestoreSteps() for the rest.
     */
    virtual bool restore(const std::string& branch) = 0;

    /**
     * @brief Forcibly closes other sessions connected to a database.
     *
     * @param database Database to drain.
     * @return bool True if the command succeeded or the engine needs no draining.
     */
    virtual bool terminateConnections(const std::string& database) = 0;

    /**
     * @brief Checks whether a dump exists for the branch.
     */
    bool dumpExists(const std::string& branch) const;

    /**
     * @brief Results of every step of the most recent restore, in execution order.
     */
    const std::vector<RestoreStep>& lastRestoreSteps() const { return restoreSteps; }

    const DatabaseConfig& config() const { return database; }
    std::filesystem::path dumpPath(const std::string& branch) const;

protected:
    DatabaseAdapter(const DatabaseConfig& config, const std::filesystem::path& dumpFolder, CommandRunner& runner);

    /**
     * @brief Expands a template for the given database, adding prefix, credentials and environment.
     */
    Command makeCommand(const CommandTemplate& tmpl, const std::string& database) const;

    /**
     * @brief Engine-specific credential and host arguments.
     */
    virtual std::vector<std::string> connectionFlags() const = 0;

    /**
     * @brief Engine-specific environment entries ("NAME=value").
     */
    virtual std::vector<std::string> environment() const { return {}; }

    bool runStep(const std::string& description, const Command& command);

    /**
     * @brief Runs a dump template into a side file and moves it over the branch's dump on success.
     *
     * A failed dump leaves the previous dump of the branch untouched.
     */
    bool writeDump(const CommandTemplate& tmpl, const std::string& branch);

    DatabaseConfig database;
    DumpFileNamer namer;
    CommandRunner& runner;
    std::vector<RestoreStep> restoreSteps;
};

/**
 * @brief PostgreSQL adapter using pg_dump/pg_restore.
 *
 * Restoring drains connections, drops and recreates the database, then imports the dump.
 */
class PostgresAdapter : public DatabaseAdapter {
public:
    PostgresAdapter(const DatabaseConfig& config, const std::filesystem::path& dumpFolder, CommandRunner& runner);

    bool dump(const std::string& branch) override;

    /**
     * @brief Restores the database from a branch dump.
     *
     * Runs, best-effort and in order: disallow connections, terminate connections, drop,
     * terminate connections, create, terminate connections, allow connections, import.
     * Only the import decides the result; a live server may re-open connections between the
     * other steps, which is why termination is repeated around the drop and create.
     */
    bool restore(const std::string& branch) override;

    bool terminateConnections(const std::string& database) override;

protected:
    std::vector<std::string> connectionFlags() const override;
    std::vector<std::string> environment() const override;
};

/**
 * @brief MySQL adapter using mysqldump/mysql.
 *
 * Dump and restore are single client invocations; the server's own locking is relied upon.
 */
class MySQLAdapter : public DatabaseAdapter {
public:
    MySQLAdapter(const DatabaseConfig& config, const std::filesystem::path& dumpFolder, CommandRunner& runner);

    bool dump(const std::string& branch) override;
    bool restore(const std::string& branch) override;
    bool terminateConnections(const std::string& database) override;

protected:
    std::vector<std::string> connectionFlags() const override;
};

#endif // DATABASE_ADAPTER_HPP
