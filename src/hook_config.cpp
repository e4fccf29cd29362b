#include "hook_config.hpp"
#include <fstream>
#include <chrono>
#include <format>
#include <print>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::optional<std::string> optionalString(const Json::Value& section, const char* key) {
    std::string value = section.get(key, "").asString();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

} // namespace

HookConfig::HookConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}: {}",
                                             configFile, reader.getFormattedErrorMessages()));
    }

    projectRoot = fs::absolute(configFile).parent_path();
    load(configJson);
}

HookConfig::HookConfig(const Json::Value& configJson, const fs::path& projectRoot)
    : projectRoot(projectRoot) {
    load(configJson);
}

void HookConfig::load(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    const Json::Value& db = configJson["database"];
    if (!db.isObject()) {
        throw std::runtime_error("Missing \"database\" section in configuration");
    }
    database.adapter = db.get("adapter", "postgres").asString();
    database.database = db.get("name", "").asString();
    if (database.database.empty()) {
        throw std::runtime_error("Missing database name (\"database.name\") in configuration");
    }
    database.user = optionalString(db, "user");
    database.password = optionalString(db, "password");
    database.host = optionalString(db, "host");
    if (int port = db.get("port", 0).asInt(); port > 0) {
        database.port = port;
    }
    database.testDatabase = optionalString(db, "test_name");
    for (const auto& part : configJson["command_prefix"]) {
        database.commandPrefix.push_back(part.asString());
    }

    fs::path folder = configJson.get("dump_folder", ".branchvault").asString();
    dumpFolder = folder.is_absolute() ? folder : projectRoot / folder;
    logFile = dumpFolder / "branchvault.log";
    errorLogFile = dumpFolder / "errors.log";
    lockFile = dumpFolder / ".branchvault.lock";

    environmentToken = configJson.get("environment_token", "development").asString();
    testEnvironmentToken = configJson.get("test_environment_token", "test").asString();

    const Json::Value& w = configJson["watcher"];
    watcher.processMarker = w.get("process_marker", watcher.processMarker).asString();
    watcher.formatterMarker = w.get("formatter_marker", watcher.formatterMarker).asString();
    watcher.pauseSignal = w.get("pause_signal", watcher.pauseSignal).asString();
    watcher.resumeSignal = w.get("resume_signal", watcher.resumeSignal).asString();
    watcher.interruptSignal = w.get("interrupt_signal", watcher.interruptSignal).asString();
    int settle = w.get("settle_seconds", static_cast<int>(watcher.settleDelay.count())).asInt();
    if (settle < 0) {
        throw std::runtime_error(std::format("Invalid watcher.settle_seconds: {}", settle));
    }
    watcher.settleDelay = std::chrono::seconds(settle);
}

void HookConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", timestamp(), message);

    std::println("{}", message);

    if (logFile.empty() || !fs::exists(logFile.parent_path())) {
        return;
    }
    std::ofstream log(logFile, std::ios::app);
    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", logFile.string());
    }
}

void HookConfig::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", timestamp(), message);

    std::println(stderr, "{}", logEntry);

    if (errorLogFile.empty() || !fs::exists(errorLogFile.parent_path())) {
        return;
    }
    std::ofstream log(errorLogFile, std::ios::app);
    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to error log file: {}", errorLogFile.string());
    }
}

std::optional<std::string> HookConfig::testDatabaseName() const {
    if (database.testDatabase) {
        return database.testDatabase;
    }
    if (environmentToken.empty()) {
        return std::nullopt;
    }
    auto pos = database.database.find(environmentToken);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string name = database.database;
    name.replace(pos, environmentToken.size(), testEnvironmentToken);
    if (name == database.database) {
        return std::nullopt;
    }
    return name;
}

Json::Value HookConfig::defaults() {
    Json::Value configJson;

    Json::Value db;
    db["adapter"] = "postgres";
    db["name"] = "app_development";
    db["user"] = "";
    db["password"] = "";
    db["host"] = "";
    db["port"] = 0;
    db["test_name"] = "";
    configJson["database"] = db;

    configJson["dump_folder"] = ".branchvault";
    configJson["environment_token"] = "development";
    configJson["test_environment_token"] = "test";
    configJson["command_prefix"] = Json::Value(Json::arrayValue);

    WatcherConfig defaultsWatcher;
    Json::Value w;
    w["process_marker"] = defaultsWatcher.processMarker;
    w["formatter_marker"] = defaultsWatcher.formatterMarker;
    w["pause_signal"] = defaultsWatcher.pauseSignal;
    w["resume_signal"] = defaultsWatcher.resumeSignal;
    w["interrupt_signal"] = defaultsWatcher.interruptSignal;
    w["settle_seconds"] = static_cast<int>(defaultsWatcher.settleDelay.count());
    configJson["watcher"] = w;

    return configJson;
}
