#include "database_adapter.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <print>
#include <utility>

namespace fs = std::filesystem;

namespace {

// PostgreSQL command templates.
const CommandTemplate kPgDump = {"pg_dump", "{connection}", "--format=custom", "{database}"};
const CommandTemplate kPgRestore = {"pg_restore", "{connection}", "--no-owner", "--no-acl", "--dbname={database}"};
const CommandTemplate kPgDrop = {"dropdb", "{connection}", "--if-exists", "{database}"};
const CommandTemplate kPgCreate = {"createdb", "{connection}", "{database}"};
const CommandTemplate kPgDisallowConnections = {
    "psql", "{connection}", "--dbname=postgres", "--no-psqlrc", "--quiet", "--set=ON_ERROR_STOP=1",
    "--command=ALTER DATABASE {database_ident} ALLOW_CONNECTIONS false;"};
const CommandTemplate kPgAllowConnections = {
    "psql", "{connection}", "--dbname=postgres", "--no-psqlrc", "--quiet", "--set=ON_ERROR_STOP=1",
    "--command=ALTER DATABASE {database_ident} ALLOW_CONNECTIONS true;"};
const CommandTemplate kPgTerminateConnections = {
    "psql", "{connection}", "--dbname=postgres", "--no-psqlrc", "--quiet", "--set=ON_ERROR_STOP=1",
    "--command=SELECT pg_terminate_backend(pid) FROM pg_stat_activity "
    "WHERE datname = {database_literal} AND pid <> pg_backend_pid();"};

constexpr const char* kPartialSuffix = "~partial";

// MySQL command templates.
const CommandTemplate kMySQLDump = {"mysqldump", "{connection}", "{database}"};
const CommandTemplate kMySQLRestore = {"mysql", "{connection}", "{database}"};

void replaceAll(std::string& text, std::string_view from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string quoted(const std::string& value, char quote) {
    std::string out(1, quote);
    for (char c : value) {
        if (c == quote) {
            out += quote;
        }
        out += c;
    }
    out += quote;
    return out;
}

void printResult(bool success) {
    std::println("{}", success ? "done!" : "failed!");
}

} // namespace

UnsupportedAdapterError::UnsupportedAdapterError(const std::string& adapterKind)
    : std::runtime_error(std::format("Unsupported database adapter: '{}' (expected postgres or mysql)", adapterKind)),
      kind(adapterKind) {}

std::unique_ptr<DatabaseAdapter> DatabaseAdapter::build(const DatabaseConfig& config,
                                                        const fs::path& dumpFolder,
                                                        CommandRunner& runner) {
    std::string kind = config.adapter;
    std::ranges::transform(kind, kind.begin(), [](unsigned char c) { return std::tolower(c); });

    if (kind == "postgres" || kind == "postgresql") {
        return std::make_unique<PostgresAdapter>(config, dumpFolder, runner);
    } else if (kind == "mysql") {
        return std::make_unique<MySQLAdapter>(config, dumpFolder, runner);
    }
    throw UnsupportedAdapterError(config.adapter);
}

DatabaseAdapter::DatabaseAdapter(const DatabaseConfig& config, const fs::path& dumpFolder, CommandRunner& runner)
    : database(config), namer(dumpFolder), runner(runner) {}

fs::path DatabaseAdapter::dumpPath(const std::string& branch) const {
    return namer.path(database.database, branch);
}

bool DatabaseAdapter::dumpExists(const std::string& branch) const {
    std::error_code ec;
    return fs::is_regular_file(dumpPath(branch), ec);
}

Command DatabaseAdapter::makeCommand(const CommandTemplate& tmpl, const std::string& name) const {
    Command command;
    command.argv = database.commandPrefix;
    for (const auto& element : tmpl) {
        if (element == "{connection}") {
            auto flags = connectionFlags();
            command.argv.insert(command.argv.end(), flags.begin(), flags.end());
            continue;
        }
        std::string arg = element;
        replaceAll(arg, "{database_ident}", quoted(name, '"'));
        replaceAll(arg, "{database_literal}", quoted(name, '\''));
        replaceAll(arg, "{database}", name);
        command.argv.push_back(std::move(arg));
    }
    command.environment = environment();
    return command;
}

bool DatabaseAdapter::runStep(const std::string& description, const Command& command) {
    bool success = runner.run(command);
    restoreSteps.push_back({description, success});
    return success;
}

bool DatabaseAdapter::writeDump(const CommandTemplate& tmpl, const std::string& branch) {
    fs::path file = dumpPath(branch);
    // '~' never appears in a sanitized branch name, so this cannot clash with another dump.
    fs::path partial = file;
    partial += kPartialSuffix;

    Command command = makeCommand(tmpl, database.database);
    command.stdoutFile = partial;
    std::error_code ec;
    if (!runner.run(command)) {
        fs::remove(partial, ec);
        return false;
    }
    fs::rename(partial, file, ec);
    if (ec) {
        std::println(stderr, "Couldn't move {} into place: {}", partial.string(), ec.message());
        fs::remove(partial, ec);
        return false;
    }
    return true;
}

PostgresAdapter::PostgresAdapter(const DatabaseConfig& config, const fs::path& dumpFolder, CommandRunner& runner)
    : DatabaseAdapter(config, dumpFolder, runner) {}

std::vector<std::string> PostgresAdapter::connectionFlags() const {
    std::vector<std::string> flags;
    if (database.user) {
        flags.push_back(std::format("--username={}", *database.user));
    }
    if (database.host) {
        flags.push_back(std::format("--host={}", *database.host));
    }
    if (database.port) {
        flags.push_back(std::format("--port={}", *database.port));
    }
    return flags;
}

std::vector<std::string> PostgresAdapter::environment() const {
    if (database.password) {
        return {std::format("PGPASSWORD={}", *database.password)};
    }
    return {};
}

bool PostgresAdapter::dump(const std::string& branch) {
    std::print("Saving state of database on '{}' branch...", branch);
    bool success = writeDump(kPgDump, branch);
    printResult(success);
    return success;
}

bool PostgresAdapter::terminateConnections(const std::string& name) {
    return runner.run(makeCommand(kPgTerminateConnections, name));
}

bool PostgresAdapter::restore(const std::string& branch) {
    restoreSteps.clear();
    auto file = dumpPath(branch);
    std::print("Restoring database from '{}' branch...", branch);
    if (!dumpExists(branch)) {
        std::println("failed! (no dump at {})", file.string());
        return false;
    }

    const std::string& name = database.database;
    runStep("disallow connections", makeCommand(kPgDisallowConnections, name));
    runStep("terminate connections", makeCommand(kPgTerminateConnections, name));
    runStep("drop database", makeCommand(kPgDrop, name));
    runStep("terminate connections", makeCommand(kPgTerminateConnections, name));
    runStep("create database", makeCommand(kPgCreate, name));
    runStep("terminate connections", makeCommand(kPgTerminateConnections, name));
    runStep("allow connections", makeCommand(kPgAllowConnections, name));

    Command importCommand = makeCommand(kPgRestore, name);
    importCommand.stdinFile = file;
    bool success = runStep("import dump", importCommand);
    printResult(success);
    return success;
}

MySQLAdapter::MySQLAdapter(const DatabaseConfig& config, const fs::path& dumpFolder, CommandRunner& runner)
    : DatabaseAdapter(config, dumpFolder, runner) {}

std::vector<std::string> MySQLAdapter::connectionFlags() const {
    std::vector<std::string> flags;
    if (database.user) {
        flags.push_back(std::format("-u{}", *database.user));
    }
    if (database.password) {
        flags.push_back(std::format("-p{}", *database.password));
    }
    if (database.host) {
        flags.push_back(std::format("-h{}", *database.host));
    }
    if (database.port) {
        flags.push_back(std::format("-P{}", *database.port));
    }
    return flags;
}

bool MySQLAdapter::dump(const std::string& branch) {
    std::print("Saving state of database on '{}' branch...", branch);
    bool success = writeDump(kMySQLDump, branch);
    printResult(success);
    return success;
}

bool MySQLAdapter::restore(const std::string& branch) {
    restoreSteps.clear();
    auto file = dumpPath(branch);
    std::print("Restoring database from '{}' branch...", branch);
    if (!dumpExists(branch)) {
        std::println("failed! (no dump at {})", file.string());
        return false;
    }

    Command command = makeCommand(kMySQLRestore, database.database);
    command.stdinFile = file;
    bool success = runStep("import dump", command);
    printResult(success);
    return success;
}

bool MySQLAdapter::terminateConnections([[maybe_unused]] const std::string& name) {
    return true;
}
